#include "supervisor/registry.hpp"

#include <spdlog/spdlog.h>

void Registry::initialize(const std::vector<ProcessSpec>& specs) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
    for (const auto& spec : specs) {
        spdlog::debug("Building runtime record for <{}>: path <{}>", spec.name, spec.start_path);
        records_[spec.name] = std::make_unique<ProcessRecord>(spec);
    }
}

bool Registry::with_record(const std::string& name, const std::function<void(ProcessRecord&)>& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(name);
    if (it == records_.end()) return false;
    fn(*it->second);
    return true;
}

void Registry::for_each(const std::function<void(ProcessRecord&)>& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : records_) {
        fn(*entry.second);
    }
}

std::optional<ProcessStatus> Registry::status(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(name);
    if (it == records_.end()) return std::nullopt;
    return it->second->status;
}

bool Registry::has_open_output(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(name);
    return it != records_.end() && it->second->output && it->second->output->is_open();
}

std::vector<std::string> Registry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(records_.size());
    for (const auto& entry : records_) {
        out.push_back(entry.first);
    }
    return out;
}

size_t Registry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}
