#include "cdnet/data/diagnostics.hpp"

#include <algorithm>
#include <cstdio>

namespace cdnet::data {

DiagnosticLog::DiagnosticLog(size_t max_entries, bool mirror_to_stderr)
    : max_entries_(std::max<size_t>(max_entries, 1)), mirror_to_stderr_(mirror_to_stderr) {}

void DiagnosticLog::add(DiagnosticLevel level, const std::string &message, size_t offset) {
    if (entries_.size() >= max_entries_) {
        entries_.pop_front();
    }

    entries_.push_back(Diagnostic{
        .level = level,
        .message = message,
        .offset = offset,
    });

    if (mirror_to_stderr_) {
        std::fprintf(stderr, "[%s] %s\n", level_prefix(level), message.c_str());
    }
}

void DiagnosticLog::info(const std::string &message, size_t offset) {
    add(DiagnosticLevel::Info, message, offset);
}

void DiagnosticLog::error(const std::string &message, size_t offset) {
    add(DiagnosticLevel::Error, message, offset);
}

const std::deque<Diagnostic> &DiagnosticLog::entries() const { return entries_; }

size_t DiagnosticLog::size() const { return entries_.size(); }

bool DiagnosticLog::empty() const { return entries_.empty(); }

size_t DiagnosticLog::count(DiagnosticLevel level) const {
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
                                             [level](const Diagnostic &d) { return d.level == level; }));
}

void DiagnosticLog::clear() { entries_.clear(); }

const char *DiagnosticLog::level_prefix(DiagnosticLevel level) {
    switch (level) {
    case DiagnosticLevel::Info:
        return "INF";
    case DiagnosticLevel::Error:
        return "ERR";
    }
    return "INF";
}

} // namespace cdnet::data
