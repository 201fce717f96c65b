#ifndef SOCIAL_NETWORK_H
#define SOCIAL_NETWORK_H

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

// Undirected simple graph over agent ids (sparse adjacency).
// Edges are stored on both endpoints; self loops and duplicates are rejected.
class SocialNetwork {
public:
    // Barabasi-Albert: star over 0..m, then each new node attaches to m
    // distinct existing nodes with probability proportional to degree.
    // Requires 1 <= m < n.
    void buildBarabasiAlbert(std::uint32_t n, std::uint32_t m, std::mt19937_64& rng);

    // n isolated nodes
    void reset(std::uint32_t n);
    void clear();

    const std::vector<std::uint32_t>& neighbors(std::uint32_t node) const { return adj_.at(node); }
    std::size_t degree(std::uint32_t node) const { return adj_.at(node).size(); }
    std::uint32_t size() const { return static_cast<std::uint32_t>(adj_.size()); }
    std::size_t edgeCount() const { return edges_; }

    bool hasEdge(std::uint32_t a, std::uint32_t b) const;

    // Returns false (no change) for self loops and existing edges
    bool addEdge(std::uint32_t a, std::uint32_t b);

    // Returns false (no change) if the edge is absent
    bool removeEdge(std::uint32_t a, std::uint32_t b);

private:
    std::vector<std::vector<std::uint32_t>> adj_;
    std::size_t edges_ = 0;

    void checkNode(std::uint32_t node) const;
};

#endif
