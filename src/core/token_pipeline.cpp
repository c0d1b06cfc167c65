#include "tokenio/token_pipeline.hpp"

namespace tio {

Processed TokenPipeline::process(std::string raw, const CallSite& caller) {
  Processed p;
  p.text = cfg_.normalizer() ? cfg_.normalizer()(raw, cfg_.user_context()) : std::move(raw);

  if (!cfg_.filter() || cfg_.filter()(p.text, cfg_.user_context())) {
    offset_ += static_cast<std::int64_t>(p.text.size());
    ++accepted_;
    p.outcome = Processed::Outcome::Accepted;
    return p;
  }

  if (cfg_.fail_on_invalid()) {
    p.outcome = Processed::Outcome::Rejected;
    p.error = ReaderError::invalid(p.text, offset_, caller);
    return p;
  }

  offset_ += static_cast<std::int64_t>(p.text.size());
  ++skipped_;
  p.outcome = Processed::Outcome::Skipped;
  p.text.clear();
  return p;
}

}
