#pragma once

#include <cstdarg>
#include <cstdio>

namespace hhrkit {

// printf-style logger. Messages go to stderr unless another sink is set;
// each line is "[LEVEL] " or "[LEVEL] <tag>: " followed by the message.
class Logger {
public:
    enum Level { kError = 0, kWarn = 1, kInfo = 2, kDebug = 3 };

    explicit Logger(Level level = kInfo, const char* tag = nullptr)
        : level_(level), tag_(tag) {}

    void set_level(Level level) { level_ = level; }
    Level level() const { return level_; }
    bool verbose() const { return level_ >= kDebug; }

    // sink is not owned; nullptr restores stderr.
    void set_sink(std::FILE* sink) { sink_ = sink; }

    void error(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        log_impl(kError, fmt, ap);
        va_end(ap);
    }

    void warn(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        log_impl(kWarn, fmt, ap);
        va_end(ap);
    }

    void info(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        log_impl(kInfo, fmt, ap);
        va_end(ap);
    }

    void debug(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        log_impl(kDebug, fmt, ap);
        va_end(ap);
    }

private:
    Level level_;
    const char* tag_;
    std::FILE* sink_ = nullptr;

    static const char* level_name(Level level) {
        switch (level) {
            case kError: return "ERROR";
            case kWarn:  return "WARN";
            case kInfo:  return "INFO";
            case kDebug: return "DEBUG";
        }
        return "?";
    }

    void log_impl(Level level, const char* fmt, va_list ap) const {
        if (level > level_) return;
        std::FILE* out = sink_ ? sink_ : stderr;
        if (tag_) {
            std::fprintf(out, "[%s] %s: ", level_name(level), tag_);
        } else {
            std::fprintf(out, "[%s] ", level_name(level));
        }
        std::vfprintf(out, fmt, ap);
        std::fprintf(out, "\n");
    }
};

} // namespace hhrkit
