#ifndef __PAGE_RANK_TRANSITION_MODEL_HH__
#define __PAGE_RANK_TRANSITION_MODEL_HH__

#include "corpus.hh"

namespace page_rank {

// Probability distribution over which page a random surfer visits after
// `page`.
//
// With probability `damping` the surfer follows one of the page's links,
// chosen uniformly. Otherwise it jumps to any page of the corpus. A page
// without links is treated as linking to every page, giving the uniform
// distribution.
//
// Throws CorpusError if `page` is not in `corpus` and ConfigError if damping
// is not in (0, 1).
Distribution TransitionModel(const Corpus &corpus, const Page &page,
                             double damping);

} // namespace page_rank

#endif
