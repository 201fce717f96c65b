#include "kernel/SocialNetwork.h"

#include <algorithm>
#include <stdexcept>
#include <string>

void SocialNetwork::clear() {
    adj_.clear();
    edges_ = 0;
}

void SocialNetwork::reset(std::uint32_t n) {
    adj_.assign(n, {});
    edges_ = 0;
}

void SocialNetwork::buildBarabasiAlbert(std::uint32_t n, std::uint32_t m, std::mt19937_64& rng) {
    if (m < 1 || m >= n) {
        throw std::invalid_argument("Barabasi-Albert requires 1 <= m < n (got m=" + std::to_string(m) +
                                    ", n=" + std::to_string(n) + ")");
    }
    reset(n);

    // Seed graph: star with hub 0 and leaves 1..m
    for (std::uint32_t leaf = 1; leaf <= m; ++leaf) {
        addEdge(0, leaf);
    }

    // Urn of node ids, each repeated once per incident edge end
    std::vector<std::uint32_t> repeated;
    repeated.reserve(2 * static_cast<std::size_t>(n) * m);
    for (std::uint32_t node = 0; node <= m; ++node) {
        repeated.insert(repeated.end(), adj_[node].size(), node);
    }

    std::vector<std::uint32_t> targets;
    targets.reserve(m);
    for (std::uint32_t source = m + 1; source < n; ++source) {
        // m distinct targets drawn from the urn
        targets.clear();
        std::uniform_int_distribution<std::size_t> pick(0, repeated.size() - 1);
        while (targets.size() < m) {
            const std::uint32_t candidate = repeated[pick(rng)];
            if (std::find(targets.begin(), targets.end(), candidate) == targets.end()) {
                targets.push_back(candidate);
            }
        }

        for (std::uint32_t t : targets) {
            addEdge(source, t);
        }
        repeated.insert(repeated.end(), targets.begin(), targets.end());
        repeated.insert(repeated.end(), m, source);
    }
}

void SocialNetwork::checkNode(std::uint32_t node) const {
    if (node >= adj_.size()) {
        throw std::out_of_range("SocialNetwork: node " + std::to_string(node) +
                                " out of range (size " + std::to_string(adj_.size()) + ")");
    }
}

bool SocialNetwork::hasEdge(std::uint32_t a, std::uint32_t b) const {
    checkNode(a);
    checkNode(b);
    // Scan the shorter list; hubs can be large
    const auto& na = adj_[a];
    const auto& nb = adj_[b];
    if (na.size() <= nb.size()) {
        return std::find(na.begin(), na.end(), b) != na.end();
    }
    return std::find(nb.begin(), nb.end(), a) != nb.end();
}

bool SocialNetwork::addEdge(std::uint32_t a, std::uint32_t b) {
    checkNode(a);
    if (a == b || hasEdge(a, b)) {
        return false;
    }
    adj_[a].push_back(b);
    adj_[b].push_back(a);
    ++edges_;
    return true;
}

bool SocialNetwork::removeEdge(std::uint32_t a, std::uint32_t b) {
    checkNode(a);
    if (a == b || !hasEdge(a, b)) {
        return false;
    }
    auto& na = adj_[a];
    auto& nb = adj_[b];
    na.erase(std::remove(na.begin(), na.end(), b), na.end());
    nb.erase(std::remove(nb.begin(), nb.end(), a), nb.end());
    --edges_;
    return true;
}
