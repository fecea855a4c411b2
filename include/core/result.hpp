#pragma once
#include <algorithm>
#include <optional>
#include <utility>

namespace core {

// Egy instrumentum feldolgozásának nem-jel kimenetei.
enum class ScanError {
    InsufficientData,    // valamelyik horizont warm-upja nem teljesült
    HorizonDisagreement, // a három horizont nem egy irányba mutat
    BelowThreshold,      // score / confidence a küszöb alatt
    FilterVeto,          // a szűrő modell elvetette
    FilterUnavailable,   // a szűrő nem futtatható (pass-through lesz belőle)
    QualityGate,         // forgalom / volatilitás túl alacsony
    InvalidAccountState, // equity <= 0 vagy leverage <= 0
    InvalidSignal        // nem pozitív ár vagy ATR, vagy sérült szint-sorrend
};
constexpr std::size_t kScanErrorCount = 8;

inline const char* to_string(ScanError e) {
    switch (e) {
        case ScanError::InsufficientData:    return "insufficient_data";
        case ScanError::HorizonDisagreement: return "horizon_disagreement";
        case ScanError::BelowThreshold:      return "below_threshold";
        case ScanError::FilterVeto:          return "filter_veto";
        case ScanError::FilterUnavailable:   return "filter_unavailable";
        case ScanError::QualityGate:         return "quality_gate";
        case ScanError::InvalidAccountState: return "invalid_account_state";
        case ScanError::InvalidSignal:       return "invalid_signal";
    }
    return "unknown";
}

// Érték vagy ScanError. A pipeline lépései ezt adják vissza kivétel helyett.
template <class T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}
    Result(ScanError err) : error_(err) {}

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return *value_; }
    T& value() { return *value_; }
    const T* operator->() const { return &*value_; }

    ScanError error() const { return error_; }

private:
    std::optional<T> value_;
    ScanError error_{ScanError::InvalidSignal};
};

// Kényelmi clamp 0..1 közé
inline double clamp01(double v) {
    return std::max(0.0, std::min(1.0, v));
}

// 0..100 közé (score / confidence)
inline double clamp100(double v) {
    return std::max(0.0, std::min(100.0, v));
}

} // namespace core
