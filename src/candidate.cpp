#include "codonbeam/candidate.hpp"
#include <algorithm>

namespace codonbeam {

CodonNode::~CodonNode() {
    // Nodes are allocated non-const (see extend), so taking the parent link
    // of a node we solely own is well defined.
    std::shared_ptr<const CodonNode> next = std::move(parent);
    while (next && next.use_count() == 1) {
        auto& owned = const_cast<CodonNode&>(*next);
        std::shared_ptr<const CodonNode> up = std::move(owned.parent);
        next = std::move(up);
    }
}

Candidate Candidate::extend(CodonIndex codon, double score_delta, size_t ordinal,
                            bool track_sixmers) const {
    Candidate next(*this);
    next.head_ = std::make_shared<CodonNode>(codon, head_);
    next.length_ = length_ + 1;
    next.score_ = score_ + score_delta;
    next.ordinal_ = ordinal;

    size_t bases = baseCount();
    for (int shift = 4; shift >= 0; shift -= 2) {
        int b = (codon >> shift) & 3;

        if (b == next.run_base_) {
            next.run_length_++;
        } else {
            next.run_base_ = b;
            next.run_length_ = 1;
        }

        next.recent_ = (next.recent_ << 2) | static_cast<uint64_t>(b);
        ++bases;

        if (track_sixmers && bases >= 6) {
            next.sixmers_.set(static_cast<size_t>(next.recent_ & 0xFFF));
        }
    }

    return next;
}

void Candidate::codonsFromEnd(std::span<CodonIndex> out) const noexcept {
    const CodonNode* node = head_.get();
    for (size_t i = out.size(); i > 0 && node; --i) {
        out[i - 1] = node->codon;
        node = node->parent.get();
    }
}

std::string Candidate::tail(size_t n) const {
    n = std::min(n, length_);
    std::string out(3 * n, 'A');

    const CodonNode* node = head_.get();
    for (size_t i = n; i > 0; --i) {
        out[3 * (i - 1)] = baseAt(node->codon >> 4);
        out[3 * (i - 1) + 1] = baseAt(node->codon >> 2);
        out[3 * (i - 1) + 2] = baseAt(node->codon);
        node = node->parent.get();
    }
    return out;
}

std::string Candidate::dna() const {
    return tail(length_);
}

} // namespace codonbeam
