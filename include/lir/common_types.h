#ifndef LIR_COMMON_TYPES_H
#define LIR_COMMON_TYPES_H

#include <stdexcept>
#include <string>

namespace lir {

// Décision à chaque point de contrôle : laisser courir ou retirer la mise
enum class Decision {
    RIDE,
    PULL
};

// Raison d'arrêt d'une session
enum class StopReason {
    WIN_LIMIT,
    LOSS_LIMIT,
    MAX_HANDS,
    INSUFFICIENT_FUNDS,
    TABLE_ROUNDS_COMPLETE, // Mode remplacement de siège : nombre de tours atteint
    IN_PROGRESS            // Session encore ouverte quand la table s'arrête
};

// Issue d'une session selon le profit final
enum class SessionOutcome {
    WIN,
    LOSS,
    PUSH
};

inline const char* decision_to_string(Decision d) {
    switch (d) {
        case Decision::RIDE: return "ride";
        case Decision::PULL: return "pull";
    }
    return "unknown";
}

inline Decision decision_from_string(const std::string& s) {
    if (s == "ride") return Decision::RIDE;
    if (s == "pull") return Decision::PULL;
    throw std::invalid_argument("Unknown decision: '" + s + "'");
}

inline const char* stop_reason_to_string(StopReason reason) {
    switch (reason) {
        case StopReason::WIN_LIMIT: return "win_limit";
        case StopReason::LOSS_LIMIT: return "loss_limit";
        case StopReason::MAX_HANDS: return "max_hands";
        case StopReason::INSUFFICIENT_FUNDS: return "insufficient_funds";
        case StopReason::TABLE_ROUNDS_COMPLETE: return "table_rounds_complete";
        case StopReason::IN_PROGRESS: return "in_progress";
    }
    return "unknown";
}

inline const char* outcome_to_string(SessionOutcome outcome) {
    switch (outcome) {
        case SessionOutcome::WIN: return "win";
        case SessionOutcome::LOSS: return "loss";
        case SessionOutcome::PUSH: return "push";
    }
    return "unknown";
}

} // namespace lir

#endif // LIR_COMMON_TYPES_H
