#pragma once

// cmd_check: validate, quota-check, score and report one section's content units.
// Usage: cgate_cli check --config <pipeline.json> --section <units.json>
// The units file is {"section_id": "...", "units": [...]}. Exits 2 when the gate fails.
int cmd_check(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
