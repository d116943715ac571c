#pragma once

#include "fepsp/features.hpp"
#include "fepsp/params.hpp"
#include "fepsp/smoothing.hpp"
#include "fepsp/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace fepsp {

// Orchestration of one recording:
//
//   transforms (caller order) -> averaging -> features (caller order)
//
// The pipeline is the only component that knows this ordering; every stage
// it calls is a pure function of the previous stage's output.

enum class TransformKind {
  BaselineCorrection,
  CropStimArtifact,
  TemplateSubtractStimArtifact,
  AverageSweeps,
};

// Registry names: "baseline_correction", "crop_stim_artifact",
// "template_subtract_stim_artifact", "average_sweeps".
std::string transform_kind_name(TransformKind kind);
bool parse_transform_kind(const std::string& s, TransformKind* out_kind);

struct TransformSpec {
  std::string name;
  ParamMap params;  // window_ms="START,END" for the windowed transforms
};

struct FeatureSpec {
  std::string name;
  ParamMap params;
  std::optional<SmoothingSpec> smoothing;  // falls back to the pipeline default
};

struct PipelineConfig {
  std::vector<TransformSpec> transforms;
  std::vector<FeatureSpec> features;
  SmoothingSpec default_smoothing;
};

// Default windows when a transform spec omits window_ms.
WindowMs default_transform_window(TransformKind kind);

// Build a configured feature: validates its parameters and resolves smoothing.
//
// Throws Error(UnknownComponent) for an unknown name and
// Error(MissingParameter)/Error(InvalidParameter) for bad parameters.
Feature build_feature(const FeatureSpec& spec, const SmoothingSpec& default_smoothing);

// Check every transform and feature of cfg before any work is done.
void validate_pipeline_config(const PipelineConfig& cfg);

// Apply one transform to ctx. average_sweeps (re)computes ctx.averaged.
void apply_transform(RecordingContext& ctx, const TransformSpec& spec);

// Run the full pipeline and hand the populated context back.
//
// - The configuration is validated first; configuration errors abort the run.
// - Throws Error(InvalidState) if the recording holds no sweeps.
// - If no average_sweeps transform ran, averaging happens after the transforms.
// - A feature whose upstream result is missing (MissingDependency) is skipped
//   with a note in ctx.notes; results computed before it are kept.
// - The resolved smoothing of each feature is recorded in ctx.metadata under
//   "smoothing.<feature>".
RecordingContext run_pipeline(RecordingContext ctx, const PipelineConfig& cfg);

} // namespace fepsp
