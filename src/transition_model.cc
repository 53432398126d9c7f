#include "transition_model.hh"
#include "errors.hh"
#include "rank_options.hh"

namespace page_rank {

Distribution TransitionModel(const Corpus &corpus, const Page &page,
                             double damping) {
  ValidateDamping(damping);
  auto it = corpus.find(page);
  if (it == corpus.end()) {
    throw CorpusError("Page '" + page + "' is not in the corpus");
  }

  const auto n = static_cast<double>(corpus.size());
  const auto &links = it->second;
  Distribution model;

  // Sinks are treated as linking to every page
  if (links.empty()) {
    for (const auto &entry : corpus) {
      model.emplace_hint(model.end(), entry.first, 1.0 / n);
    }
    return model;
  }

  const double prob_random = (1.0 - damping) / n;
  const double prob_linked = damping / static_cast<double>(links.size());
  for (const auto &entry : corpus) {
    double prob = prob_random;
    if (links.count(entry.first) != 0) {
      prob += prob_linked;
    }
    model.emplace_hint(model.end(), entry.first, prob);
  }
  return model;
}

} // namespace page_rank
