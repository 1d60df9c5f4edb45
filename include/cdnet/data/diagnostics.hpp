#pragma once

#include <cstddef>
#include <deque>
#include <string>

namespace cdnet::data {

enum class DiagnosticLevel {
    Info,
    Error,
};

/// A single decoder diagnostic.
struct Diagnostic {
    DiagnosticLevel level = DiagnosticLevel::Info;
    std::string message;
    size_t offset = 0; // byte offset of the part in the packet
};

/// Rolling log of decoder diagnostics.
/// Entries are also mirrored to stderr unless mirroring is disabled.
/// Thread safety: none; use one log per decoding thread.
class DiagnosticLog {
  public:
    static constexpr size_t kDefaultMaxEntries = 1000;

    explicit DiagnosticLog(size_t max_entries = kDefaultMaxEntries, bool mirror_to_stderr = true);

    void add(DiagnosticLevel level, const std::string &message, size_t offset = 0);
    void info(const std::string &message, size_t offset = 0);
    void error(const std::string &message, size_t offset = 0);

    [[nodiscard]] const std::deque<Diagnostic> &entries() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const;
    [[nodiscard]] size_t count(DiagnosticLevel level) const;

    void clear();

    static const char *level_prefix(DiagnosticLevel level);

  private:
    size_t max_entries_ = kDefaultMaxEntries;
    bool mirror_to_stderr_ = true;
    std::deque<Diagnostic> entries_;
};

} // namespace cdnet::data
