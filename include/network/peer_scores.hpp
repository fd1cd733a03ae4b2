#ifndef KNAPSACK_PEER_SCORES_HPP
#define KNAPSACK_PEER_SCORES_HPP

#include <map>
#include <mutex>
#include <vector>

#include "../dht/kademlia.hpp" // For PeerId

/**
 * @brief Trust score per remote peer, used to order candidate providers.
 *
 * Unknown peers start at zero. Integrity violations weigh far more than
 * timeouts: a slow peer is merely unlucky, a corrupting one is suspect.
 */
class PeerScores {
public:
    static constexpr int SUCCESS_BONUS = 1;
    static constexpr int TIMEOUT_PENALTY = 2;
    static constexpr int ERROR_PENALTY = 2;
    static constexpr int INTEGRITY_PENALTY = 25;
    static constexpr int MAX_SCORE = 100;
    static constexpr int MIN_SCORE = -1000;

    void record_success(const PeerId& peer);
    void record_timeout(const PeerId& peer);
    void record_error(const PeerId& peer);
    void record_integrity_violation(const PeerId& peer);

    int score(const PeerId& peer) const;

    // Highest score first; ties keep their input order.
    std::vector<PeerId> rank(std::vector<PeerId> peers) const;

private:
    void adjust(const PeerId& peer, int delta);

    std::map<PeerId, int> scores_;
    mutable std::mutex mutex_;
};

#endif // KNAPSACK_PEER_SCORES_HPP
