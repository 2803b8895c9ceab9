#pragma once

// cmd_state: inspect and maintain the persisted state of one run.
// Usage: cgate_cli state <action> --run-id <id> (--store-dir <dir> | --db <path>)
//                        [--name <checkpoint>]
// Actions: status, validate, repair, checkpoint, recover, list, audit.
// checkpoint and recover require --name. validate and audit exit 2 when the state or
// the audit chain is not healthy.
int cmd_state(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
