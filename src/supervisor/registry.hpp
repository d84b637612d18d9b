#pragma once

#include "supervisor/process_record.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/// Name -> ProcessRecord map. Every read and write of a record goes
/// through with_record() or for_each(), which hold the single registry lock.
class Registry {
public:
    Registry() = default;

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    /// Replace the whole map. Call before any launch or monitor task starts.
    void initialize(const std::vector<ProcessSpec>& specs);

    /// Run fn on the named record under the lock. Returns false if there is no such record.
    bool with_record(const std::string& name, const std::function<void(ProcessRecord&)>& fn);

    /// Run fn on every record, in name order, under the lock
    void for_each(const std::function<void(ProcessRecord&)>& fn);

    /// Copy of a record's status taken under the lock
    std::optional<ProcessStatus> status(const std::string& name) const;

    /// Whether the named record currently owns an open output file
    bool has_open_output(const std::string& name) const;

    std::vector<std::string> names() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<ProcessRecord>> records_;
};
