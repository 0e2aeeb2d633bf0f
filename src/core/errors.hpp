#pragma once

#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// ValidationError — malformed leg, pick, market type or argument.
// Never retried; surfaced to the caller of the failing operation.
// ---------------------------------------------------------------------------
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& what)
        : std::invalid_argument(what) {}
};

// ---------------------------------------------------------------------------
// InsufficientCandidatesError — fewer legs than requested after full relaxation.
// Carries the counts and a remediation hint so callers can offer a downgrade.
// ---------------------------------------------------------------------------
class InsufficientCandidatesError : public std::runtime_error {
public:
    enum class Remediation {
        NONE,
        NO_GAMES,         // nothing scheduled
        ODDS_NOT_LOADED,  // games scheduled, markets missing
        LOW_CONFIDENCE,   // markets loaded, not enough edges
    };

    InsufficientCandidatesError(int needed, int have, const std::string& message,
                                Remediation remediation = Remediation::NONE)
        : std::runtime_error(message),
          needed_(needed), have_(have), remediation_(remediation) {}

    int needed() const { return needed_; }
    int have() const { return have_; }
    Remediation remediation() const { return remediation_; }

private:
    int needed_;
    int have_;
    Remediation remediation_;
};

inline const char* remediation_name(InsufficientCandidatesError::Remediation r) {
    switch (r) {
        case InsufficientCandidatesError::Remediation::NO_GAMES:        return "no_games";
        case InsufficientCandidatesError::Remediation::ODDS_NOT_LOADED: return "odds_not_loaded";
        case InsufficientCandidatesError::Remediation::LOW_CONFIDENCE:  return "low_confidence";
        case InsufficientCandidatesError::Remediation::NONE:            break;
    }
    return "none";
}

// ---------------------------------------------------------------------------
// Storage errors — raised only at the persistence boundary.
// TransientStorageError is retried there (bounded backoff); StorageError is not.
// ---------------------------------------------------------------------------
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what)
        : std::runtime_error(what) {}
};

class TransientStorageError : public StorageError {
public:
    explicit TransientStorageError(const std::string& what)
        : StorageError(what) {}
};

// ---------------------------------------------------------------------------
// ComputationError — internal invariant violated. Fatal for the request.
// ---------------------------------------------------------------------------
class ComputationError : public std::logic_error {
public:
    explicit ComputationError(const std::string& what)
        : std::logic_error(what) {}
};
