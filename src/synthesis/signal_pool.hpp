#pragma once

/// @file signal_pool.hpp
/// @brief Append-only arena of distinct signals, indexed by bit-vector identity

#include "synthesis/bit_vector.hpp"
#include "synthesis/gate_library.hpp"
#include "synthesis/signal.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <unordered_map>
#include <vector>

namespace gatesynth {

/// Outcome of SignalPool::try_insert
struct InsertResult {
    SignalId id = 0;     ///< The new signal, or the existing one with the same bits
    bool is_new = false; ///< False when the candidate was a duplicate and was discarded
};

/// Half-open id range [begin, end) of the signals first produced at one level
struct LevelRange {
    SignalId begin = 0;
    SignalId end = 0;

    [[nodiscard]] size_t size() const { return end - begin; }
    [[nodiscard]] bool empty() const { return begin == end; }
};

/// The set of all signals discovered in one search run.
///
/// At most one signal exists per distinct bit vector. Signals are appended
/// level by level (levels never decrease), ids follow creation order, and a
/// derived signal only references signals with smaller ids. References
/// returned by at() stay valid while signals are appended.
///
/// The pool does not own the gate library; the library must outlive it.
class SignalPool {
  public:
    /// @param library Gate library used to look up the cost of derived signals
    /// @param num_rows Length every bit vector in this pool must have
    SignalPool(const GateLibrary& library, size_t num_rows);

    // Non-copyable (signals refer to each other by id within one pool)
    SignalPool(const SignalPool&) = delete;
    SignalPool& operator=(const SignalPool&) = delete;

    /// Inserts a signal unless one with the same bits exists.
    /// Own cost is 0 for leaves and the gate cost for derived signals.
    /// @throws std::invalid_argument if the bits have the wrong length, the
    ///         level is older than the newest open level, a derived origin
    ///         names an unknown gate, or it references a signal that is not
    ///         strictly older
    InsertResult try_insert(BitVector bits, Origin origin, int level);

    /// Makes sure the given level exists (possibly empty)
    void open_level(int level);

    /// @throws std::out_of_range for an unknown id
    [[nodiscard]] const Signal& at(SignalId id) const;
    [[nodiscard]] const Signal& operator[](SignalId id) const { return signals_[id]; }

    [[nodiscard]] std::optional<SignalId> find(const BitVector& bits) const;
    [[nodiscard]] bool contains(const BitVector& bits) const { return index_.count(bits) != 0; }

    [[nodiscard]] size_t size() const { return signals_.size(); }
    [[nodiscard]] size_t num_rows() const { return num_rows_; }
    [[nodiscard]] const GateLibrary& library() const { return *library_; }

    /// Newest open level, or -1 for an empty pool
    [[nodiscard]] int max_level() const { return static_cast<int>(level_begin_.size()) - 1; }

    /// Signals first produced at the given level (empty range if none)
    [[nodiscard]] LevelRange level_range(int level) const;

    /// Unique ids reachable from the roots through origin inputs, roots
    /// included, in ascending order
    [[nodiscard]] std::vector<SignalId> cone(const std::vector<SignalId>& roots) const;

    /// Sum of own costs over cone(roots); shared signals count once
    [[nodiscard]] double cone_cost(const std::vector<SignalId>& roots) const;

    /// Evaluates a signal's gate over the stored bits of its inputs (a leaf
    /// returns its own bits)
    /// @throws std::out_of_range for an unknown id
    [[nodiscard]] BitVector recompute(SignalId id) const;

    /// Re-derives every signal's bits from its origin alone, bottom-up from
    /// the leaf columns. Index i holds the recomputed bits of signal i.
    [[nodiscard]] std::vector<BitVector> recompute_all() const;

    /// Lossy capacity policy: keeps only the cap cheapest signals of the
    /// newest level (by cone cost, then creation order). Removed bit vectors
    /// may be rediscovered at a later level. Ids of the kept signals are
    /// compacted.
    /// @return number of signals removed
    /// @throws std::invalid_argument if level is not the newest level
    size_t retain_cheapest(int level, size_t cap);

  private:
    const GateLibrary* library_;
    size_t num_rows_;
    std::deque<Signal> signals_;
    std::unordered_map<BitVector, SignalId, BitVectorHash> index_;
    std::vector<SignalId> level_begin_; ///< level_begin_[l] = first id of level l
};

} // namespace gatesynth
