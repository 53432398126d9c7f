#ifndef __PAGE_RANK_VALIDATOR_HH__
#define __PAGE_RANK_VALIDATOR_HH__

#include "corpus.hh"

namespace page_rank {

// Precondition gate run before ranking. Throws CorpusError when a page
// identifier or link target is empty, when a link points outside the corpus
// or when a page links to itself. Never modifies the corpus.
void ValidateCorpus(const Corpus &corpus);

} // namespace page_rank

#endif
