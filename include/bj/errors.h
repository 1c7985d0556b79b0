#ifndef BJ_ERRORS_H
#define BJ_ERRORS_H

#include <stdexcept>
#include <string>

namespace bj_engine {

// Action demandée hors de l'ensemble légal courant (hit après stand, split d'une non-paire...).
// Rejetée avant toute mutation: l'appelant peut simplement choisir une autre action.
class IllegalActionError : public std::logic_error {
public:
    explicit IllegalActionError(const std::string& what) : std::logic_error(what) {}
};

// Opération structurellement impossible sur une main (Hand::split sur une non-paire)
class InvalidOperationError : public IllegalActionError {
public:
    explicit InvalidOperationError(const std::string& what) : IllegalActionError(what) {}
};

// Mise, double ou split au-delà de la bankroll disponible
class InsufficientFundsError : public std::runtime_error {
public:
    explicit InsufficientFundsError(const std::string& what) : std::runtime_error(what) {}
};

// Split demandé alors que max_splits est atteint
class SplitLimitError : public std::runtime_error {
public:
    explicit SplitLimitError(const std::string& what) : std::runtime_error(what) {}
};

// deal() sur un sabot vide: l'appelant n'a pas vérifié needs_shuffle entre deux tours.
// Fatal pour le tour en cours.
class ShoeExhaustedError : public std::runtime_error {
public:
    explicit ShoeExhaustedError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace bj_engine

#endif // BJ_ERRORS_H
