#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Batch selection and output.
DECLARE_string(tasks);
DECLARE_string(instance_ids);
DECLARE_string(instance_range);
DECLARE_string(predictions);
DECLARE_bool(resume);
DECLARE_string(output_dir);
DECLARE_int32(num_workers);
DECLARE_string(temp_directory);

// Sandboxes.
DECLARE_string(provider);
DECLARE_string(image_prefix);
DECLARE_bool(docker_pull);
DECLARE_string(default_workdir);
DECLARE_string(env_preamble);
DECLARE_int32(command_timeout_seconds);
DECLARE_int32(provision_timeout_seconds);
DECLARE_int32(write_chunk_bytes);

// Agent loop.
DECLARE_int32(max_iterations);
DECLARE_int32(reset_interval);
DECLARE_int32(file_char_ceiling);
DECLARE_bool(parallel_read_only);
DECLARE_string(source_extensions);
DECLARE_string(system_prompt_file);

// Model.
DECLARE_string(model_command);
DECLARE_string(model);
DECLARE_double(temperature);
DECLARE_int32(max_tokens);
DECLARE_int32(model_timeout_seconds);
DECLARE_int32(model_max_attempts);
DECLARE_int32(model_initial_backoff_millis);
DECLARE_int32(model_max_backoff_millis);

// Grading.
DECLARE_bool(grade_empty_patch);
DECLARE_string(fuzzy_apply_command);
DECLARE_int32(test_timeout_seconds);

#endif
