#include "WorkerContext.hpp"
#include "LogUtils.hpp"

namespace {
thread_local WorkerContext* current_context = nullptr;
}

WorkerContext::WorkerContext(std::string name, Properties properties, bool can_kill)
    : name_(std::move(name)),
      properties_(std::move(properties)),
      can_kill_(can_kill),
      token_(name_) {}

std::string WorkerContext::property(const std::string& key, const std::string& fallback) const {
    auto it = properties_.find(key);
    return it != properties_.end() ? it->second : fallback;
}

std::string WorkerContext::expand(const std::string& text) const {
    std::string result;
    result.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find('{', pos);
        size_t close = open == std::string::npos ? std::string::npos : text.find('}', open + 1);
        if (close == std::string::npos) {
            result.append(text, pos, std::string::npos);
            break;
        }

        result.append(text, pos, open - pos);
        const std::string key = text.substr(open + 1, close - open - 1);
        auto it = properties_.find(key);
        if (it != properties_.end()) {
            result += it->second;
        } else if (key == "name") {
            result += name_;
        } else {
            result.append(text, open, close - open + 1);
        }
        pos = close + 1;
    }
    return result;
}

WorkerContext* WorkerContext::current() {
    return current_context;
}

void WorkerContext::set_current(WorkerContext* context) {
    current_context = context;
}

void WorkerContext::remove_current() {
    current_context = nullptr;
}

WorkerContext::Scope::Scope(WorkerContext& context) {
    WorkerContext::set_current(&context);
    LogUtils::set_thread_tag(context.name());
}

WorkerContext::Scope::~Scope() {
    WorkerContext::remove_current();
    LogUtils::clear_thread_tag();
}
