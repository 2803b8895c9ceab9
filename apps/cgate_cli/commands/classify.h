#pragma once

// cmd_classify: classify a batch of items and print the assignments as JSON.
// Usage: cgate_cli classify --config <pipeline.json> --items <items.json>
int cmd_classify(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
