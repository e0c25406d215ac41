#include "processing_stats.hpp"

namespace pef::model {

ProcessingStats& ProcessingStats::operator+=(const ProcessingStats& other) {
  processed += other.processed;
  skipped += other.skipped;
  errors += other.errors;
  tag_errors += other.tag_errors;
  with_geo += other.with_geo;
  with_people += other.with_people;
  unmatched_sidecars += other.unmatched_sidecars;
  unmatched_media += other.unmatched_media;
  return *this;
}

pef::state::v1::ProcessingStats ToProto(const ProcessingStats& stats) {
  pef::state::v1::ProcessingStats out;
  out.set_processed(stats.processed);
  out.set_skipped(stats.skipped);
  out.set_errors(stats.errors);
  out.set_tag_errors(stats.tag_errors);
  out.set_with_geo(stats.with_geo);
  out.set_with_people(stats.with_people);
  out.set_unmatched_sidecars(stats.unmatched_sidecars);
  out.set_unmatched_media(stats.unmatched_media);
  return out;
}

ProcessingStats FromProto(const pef::state::v1::ProcessingStats& stats) {
  ProcessingStats out;
  out.processed          = stats.processed();
  out.skipped            = stats.skipped();
  out.errors             = stats.errors();
  out.tag_errors         = stats.tag_errors();
  out.with_geo           = stats.with_geo();
  out.with_people        = stats.with_people();
  out.unmatched_sidecars = stats.unmatched_sidecars();
  out.unmatched_media    = stats.unmatched_media();
  return out;
}

} // namespace pef::model
