#include "network/peer_scores.hpp"
#include <algorithm>

void PeerScores::adjust(const PeerId& peer, int delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    int& value = scores_[peer];
    value = std::clamp(value + delta, MIN_SCORE, MAX_SCORE);
}

void PeerScores::record_success(const PeerId& peer) { adjust(peer, SUCCESS_BONUS); }
void PeerScores::record_timeout(const PeerId& peer) { adjust(peer, -TIMEOUT_PENALTY); }
void PeerScores::record_error(const PeerId& peer) { adjust(peer, -ERROR_PENALTY); }
void PeerScores::record_integrity_violation(const PeerId& peer) { adjust(peer, -INTEGRITY_PENALTY); }

int PeerScores::score(const PeerId& peer) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = scores_.find(peer);
    return it == scores_.end() ? 0 : it->second;
}

std::vector<PeerId> PeerScores::rank(std::vector<PeerId> peers) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto lookup = [this](const PeerId& peer) {
        auto it = scores_.find(peer);
        return it == scores_.end() ? 0 : it->second;
    };
    std::stable_sort(peers.begin(), peers.end(), [&lookup](const PeerId& a, const PeerId& b) {
        return lookup(a) > lookup(b);
    });
    return peers;
}
