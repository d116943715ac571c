#include "fepsp/pipeline.hpp"

#include "fepsp/averaging.hpp"
#include "fepsp/errors.hpp"
#include "fepsp/transforms.hpp"
#include "fepsp/utils.hpp"

#include <sstream>
#include <utility>

namespace fepsp {

namespace {

const char* kTransformNames = "baseline_correction, crop_stim_artifact, template_subtract_stim_artifact, average_sweeps";
const char* kFeatureNames = "epsp, fiber_volley, pop_spike";

TransformKind require_transform_kind(const std::string& name) {
  TransformKind kind;
  if (!parse_transform_kind(name, &kind)) {
    throw Error(ErrorKind::UnknownComponent,
                "Unknown transform '" + name + "'. Available: " + kTransformNames);
  }
  return kind;
}

WindowMs transform_window(TransformKind kind, const ParamMap& params) {
  const std::string owner = transform_kind_name(kind);
  // Older configurations name the baseline window baseline_window_ms.
  if (kind == TransformKind::BaselineCorrection && has_param(params, "baseline_window_ms")) {
    return param_window(params, "baseline_window_ms", owner);
  }
  return param_window_or(params, "window_ms", default_transform_window(kind), owner);
}

} // namespace

std::string transform_kind_name(TransformKind kind) {
  switch (kind) {
    case TransformKind::BaselineCorrection:
      return "baseline_correction";
    case TransformKind::CropStimArtifact:
      return "crop_stim_artifact";
    case TransformKind::TemplateSubtractStimArtifact:
      return "template_subtract_stim_artifact";
    case TransformKind::AverageSweeps:
      return "average_sweeps";
    default:
      return "unknown";
  }
}

bool parse_transform_kind(const std::string& s_in, TransformKind* out_kind) {
  if (!out_kind) return false;
  const std::string s = to_lower(trim(s_in));
  if (s == "baseline_correction" || s == "baseline") {
    *out_kind = TransformKind::BaselineCorrection;
    return true;
  }
  if (s == "crop_stim_artifact" || s == "crop") {
    *out_kind = TransformKind::CropStimArtifact;
    return true;
  }
  if (s == "template_subtract_stim_artifact" || s == "template_subtract") {
    *out_kind = TransformKind::TemplateSubtractStimArtifact;
    return true;
  }
  if (s == "average_sweeps" || s == "average") {
    *out_kind = TransformKind::AverageSweeps;
    return true;
  }
  return false;
}

WindowMs default_transform_window(TransformKind kind) {
  WindowMs w;
  switch (kind) {
    case TransformKind::BaselineCorrection:
      w.end_ms = 0.1;
      break;
    case TransformKind::CropStimArtifact:
    case TransformKind::TemplateSubtractStimArtifact:
      w.end_ms = 1.25;
      break;
    default:
      break;
  }
  return w;
}

Feature build_feature(const FeatureSpec& spec, const SmoothingSpec& default_smoothing) {
  Feature f;
  if (!parse_feature_kind(spec.name, &f.kind)) {
    throw Error(ErrorKind::UnknownComponent,
                "Unknown feature '" + spec.name + "'. Available: " + kFeatureNames);
  }
  switch (f.kind) {
    case FeatureKind::FiberVolley:
      f.fiber_volley = fiber_volley_params(spec.params);
      break;
    case FeatureKind::Epsp:
      f.epsp = epsp_params(spec.params);
      break;
    case FeatureKind::PopSpike:
      f.pop_spike = pop_spike_params(spec.params);
      break;
  }
  f.smoothing = resolve_smoothing(spec.smoothing, default_smoothing);
  return f;
}

void validate_pipeline_config(const PipelineConfig& cfg) {
  for (const auto& t : cfg.transforms) {
    const TransformKind kind = require_transform_kind(t.name);
    if (kind != TransformKind::AverageSweeps) {
      const WindowMs w = transform_window(kind, t.params);
      if (w.end_ms < w.start_ms) {
        throw Error(ErrorKind::InvalidParameter,
                    transform_kind_name(kind) + ": window end must be >= start");
      }
    }
  }
  for (const auto& f : cfg.features) {
    (void)build_feature(f, cfg.default_smoothing);
  }
}

void apply_transform(RecordingContext& ctx, const TransformSpec& spec) {
  const TransformKind kind = require_transform_kind(spec.name);
  switch (kind) {
    case TransformKind::BaselineCorrection:
      ctx.sweeps = baseline_correction(ctx.sweeps, transform_window(kind, spec.params));
      break;
    case TransformKind::CropStimArtifact:
      ctx.sweeps = crop_stim_artifact(ctx.sweeps, transform_window(kind, spec.params));
      break;
    case TransformKind::TemplateSubtractStimArtifact: {
      std::vector<double> skipped;
      ctx.sweeps = template_subtract_stim_artifact(ctx.sweeps, transform_window(kind, spec.params), &skipped);
      for (double stim : skipped) {
        std::ostringstream oss;
        oss << "template_subtract_stim_artifact: template energy ~0 in window at stim_intensity="
            << stim << "; sweeps left unchanged";
        ctx.notes.push_back(oss.str());
      }
      break;
    }
    case TransformKind::AverageSweeps:
      ctx.averaged = average_sweeps(ctx.sweeps);
      break;
  }
}

RecordingContext run_pipeline(RecordingContext ctx, const PipelineConfig& cfg) {
  if (!(ctx.fs_hz > 0.0)) {
    throw Error(ErrorKind::InvalidParameter, "run_pipeline: sampling rate must be > 0");
  }
  validate_pipeline_config(cfg);
  if (ctx.sweeps.empty()) {
    throw Error(ErrorKind::InvalidState, "run_pipeline: the recording holds no sweeps");
  }

  std::vector<Feature> features;
  features.reserve(cfg.features.size());
  for (const auto& spec : cfg.features) {
    features.push_back(build_feature(spec, cfg.default_smoothing));
  }

  ctx.sweeps.sort();
  bool averaged = false;
  for (const auto& t : cfg.transforms) {
    apply_transform(ctx, t);
    TransformKind kind;
    if (parse_transform_kind(t.name, &kind)) {
      // A transform after averaging invalidates the averaged table.
      averaged = (kind == TransformKind::AverageSweeps);
    }
  }
  if (!averaged) {
    ctx.averaged = average_sweeps(ctx.sweeps);
  }

  for (const auto& f : features) {
    ctx.metadata["smoothing." + f.name()] = smoothing_spec_to_string(f.smoothing);
    try {
      ctx.add_result(f.name(), f.compute(ctx));
    } catch (const Error& e) {
      if (e.kind() != ErrorKind::MissingDependency) throw;
      ctx.notes.push_back(std::string("skipped feature ") + f.name() + ": " + e.what());
    }
  }
  return ctx;
}

} // namespace fepsp
