#pragma once

#include <iostream>
#include <streambuf>

namespace perp {

// Per-fill and per-event logging; keep false outside of debugging sessions
inline constexpr bool kEnableHotPathLogging = false;

// Component prefixes used on std::cout / std::cerr lines
inline constexpr const char* kLogOrderBook = "[ORDER BOOK] ";
inline constexpr const char* kLogEngine = "[MATCHING ENGINE] ";
inline constexpr const char* kLogOrchestrator = "[ORCHESTRATOR] ";
inline constexpr const char* kLogExecutor = "[EXECUTOR] ";
inline constexpr const char* kLogJournal = "[JOURNAL] ";
inline constexpr const char* kLogPublisher = "[PUBLISHER] ";
inline constexpr const char* kLogConfig = "[CONFIG] ";

class NullBuffer : public std::streambuf {
protected:
    int overflow(int c) override {
        return c;
    }
};

/**
 * Redirects a stream into a null buffer for the lifetime of the object.
 * Tests use it to keep expected warnings out of the output.
 */
class ScopedStreamSilencer {
public:
    ScopedStreamSilencer(std::ostream& stream, bool active)
        : stream_(stream), active_(active), original_(nullptr) {
        if (active_) {
            original_ = stream_.rdbuf(&null_buffer());
        }
    }

    ~ScopedStreamSilencer() {
        if (active_ && original_) {
            stream_.rdbuf(original_);
        }
    }

    ScopedStreamSilencer(const ScopedStreamSilencer&) = delete;
    ScopedStreamSilencer& operator=(const ScopedStreamSilencer&) = delete;

private:
    static NullBuffer& null_buffer() {
        static NullBuffer buffer;
        return buffer;
    }

    std::ostream& stream_;
    bool active_;
    std::streambuf* original_;
};

class ScopedCoutSilencer : public ScopedStreamSilencer {
public:
    explicit ScopedCoutSilencer(bool active) : ScopedStreamSilencer(std::cout, active) {}
};

class ScopedCerrSilencer : public ScopedStreamSilencer {
public:
    explicit ScopedCerrSilencer(bool active) : ScopedStreamSilencer(std::cerr, active) {}
};

} // namespace perp
