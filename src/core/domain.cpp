#include "crossword_csp/domain.hpp"
#include "crossword_csp/puzzle.hpp"
#include <cassert>

namespace crossword_csp {

Domain::Domain(size_t universe)
    : values_(universe)
    , sparse_(universe)
    , n_(universe) {
    for (size_t i = 0; i < universe; ++i) {
        values_[i] = i;
        sparse_[i] = i;
    }
}

bool Domain::remove(value_type value) {
    if (!contains(value)) {
        return false;
    }
    remove_at(sparse_[value]);
    return true;
}

void Domain::remove_at(size_t idx) {
    assert(idx < n_ && "remove_at: index out of active range");
    swap_at(idx, n_ - 1);
    --n_;
}

bool Domain::assign(value_type value) {
    if (!contains(value)) {
        return false;
    }
    swap_at(sparse_[value], 0);
    n_ = 1;
    return true;
}

std::vector<Domain::value_type> Domain::values() const {
    return std::vector<value_type>(begin(), end());
}

void Domain::set_n(size_t n) {
    assert(n <= values_.size() && "set_n: size exceeds universe");
    n_ = n;
}

void Domain::swap_at(size_t i, size_t j) {
    if (i == j) return;
    value_type vi = values_[i];
    value_type vj = values_[j];
    values_[i] = vj;
    values_[j] = vi;
    sparse_[vi] = j;
    sparse_[vj] = i;
}

// ===== DomainStore =====

DomainStore::DomainStore(const Puzzle& puzzle)
    : domains_(puzzle.slot_count(), Domain(puzzle.word_count())) {}

size_t DomainStore::total_size() const {
    size_t total = 0;
    for (const auto& d : domains_) {
        total += d.size();
    }
    return total;
}

bool DomainStore::has_empty() const {
    for (const auto& d : domains_) {
        if (d.empty()) return true;
    }
    return false;
}

std::vector<size_t> DomainStore::snapshot() const {
    std::vector<size_t> sizes;
    sizes.reserve(domains_.size());
    for (const auto& d : domains_) {
        sizes.push_back(d.size());
    }
    return sizes;
}

void DomainStore::restore(const std::vector<size_t>& sizes) {
    assert(sizes.size() == domains_.size() && "restore: snapshot size mismatch");
    for (size_t i = 0; i < domains_.size(); ++i) {
        domains_[i].set_n(sizes[i]);
    }
}

} // namespace crossword_csp
