#pragma once

// cmd_run: run (or resume) the full pipeline for one run id.
// Usage: cgate_cli run --config <pipeline.json> --items <items.json>
//                      --sections <recorded_units.json> --run-id <id>
//                      (--store-dir <dir> | --db <path>) [--workers <n>]
// Exits 0 when the run completes or stops cleanly and 2 when it ends failed.
int cmd_run(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
