#pragma once

#include <string>
#include <utility>

// ---------------------------------------------------------------------------
// StageStatus / StageResult — tagged {Ok(value) | Degraded(value, reason)}
//
// Every analysis stage returns one of these. A degraded result still carries
// a structurally complete (neutral or fallback) value.
// ---------------------------------------------------------------------------
enum class StageStatus { Ok, Degraded };

template <typename T>
struct StageResult {
    T value{};
    StageStatus status = StageStatus::Ok;
    std::string reason;

    static StageResult ok(T v) {
        StageResult r;
        r.value = std::move(v);
        return r;
    }

    static StageResult degraded(T v, std::string why) {
        StageResult r;
        r.value = std::move(v);
        r.status = StageStatus::Degraded;
        r.reason = std::move(why);
        return r;
    }

    bool is_ok() const { return status == StageStatus::Ok; }
    bool is_degraded() const { return status == StageStatus::Degraded; }
};

inline const char* to_string(StageStatus s) {
    return s == StageStatus::Ok ? "ok" : "degraded";
}
