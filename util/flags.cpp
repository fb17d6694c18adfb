#include "util/flags.hpp"

DEFINE_string(tasks, "", "JSON Lines file with one TaskSpec per line");
DEFINE_string(instance_ids, "",
              "Comma separated list of instance ids to process. If unset, "
              "every instance in --tasks is processed");
DEFINE_string(instance_range, "",
              "Range of instances to process, as start:end (0-based, end "
              "excluded)");
DEFINE_string(predictions, "",
              "JSON Lines file of {instance_id, model_patch}. If set, the "
              "agent is skipped and only grading is performed");
DEFINE_bool(resume, false,
            "Skip instances that already have a record in results.jsonl");
DEFINE_string(output_dir, "runs", "Where per-instance artifacts are written");
DEFINE_int32(num_workers, 1, "Number of instances processed in parallel");
DEFINE_string(temp_directory, "/tmp",
              "Where temporary files and local sandboxes are created");

DEFINE_string(provider, "docker", "Isolation provider: docker or local");
DEFINE_string(image_prefix, "",
              "Registry prefix for images derived from the instance id");
DEFINE_bool(docker_pull, false, "Pull the image before starting an instance");
DEFINE_string(default_workdir, "/testbed",
              "Repository directory inside the instance");
DEFINE_string(env_preamble,
              ". /opt/miniconda3/etc/profile.d/conda.sh && conda activate "
              "testbed && git config --global --add safe.directory '*' && "
              "git config --global core.pager cat",
              "Shell prefix run before every command");
DEFINE_int32(command_timeout_seconds, 120,
             "Default timeout for commands run by the agent");
DEFINE_int32(provision_timeout_seconds, 600,
             "Timeout for starting, copying into and removing instances");
DEFINE_int32(write_chunk_bytes, 64 * 1024,
             "Size of the base64 chunks used to write files into instances");

DEFINE_int32(max_iterations, 30, "Maximum number of agent steps per instance");
DEFINE_int32(reset_interval, 8,
             "Number of steps after which the conversation is rebuilt from "
             "the workspace report");
DEFINE_int32(file_char_ceiling, 80000,
             "Maximum number of characters rendered per open file");
DEFINE_bool(parallel_read_only, true,
            "Run batches of read-only tool calls concurrently");
DEFINE_string(source_extensions, "py,pyx,c,cc,cpp,h,hpp,go,rs,java,js,ts",
              "Extensions used to detect the primary source folder");
DEFINE_string(system_prompt_file, "",
              "File with the system prompt. If unset, a short built-in "
              "prompt is used");

DEFINE_string(model_command, "",
              "Program answering model requests: reads a ModelRequest JSON "
              "on stdin, writes a ModelResponse JSON on stdout");
DEFINE_string(model, "", "Model name forwarded to --model_command");
DEFINE_double(temperature, 0.0, "Sampling temperature");
DEFINE_int32(max_tokens, 4096, "Maximum number of tokens per completion");
DEFINE_int32(model_timeout_seconds, 600, "Timeout of a single model call");
DEFINE_int32(model_max_attempts, 5, "Attempts for retryable model errors");
DEFINE_int32(model_initial_backoff_millis, 2000,
             "Backoff before the first model retry; doubled every attempt");
DEFINE_int32(model_max_backoff_millis, 60000, "Upper bound of the backoff");

DEFINE_bool(grade_empty_patch, false,
            "Run the evaluation on the unmodified baseline when the patch is "
            "empty, instead of reporting it as an empty patch");
DEFINE_string(fuzzy_apply_command,
              "patch --batch --fuzz=5 -p1 --no-backup-if-mismatch -i",
              "Command used when git apply fails; the patch path is appended");
DEFINE_int32(test_timeout_seconds, 1800, "Timeout of the evaluation script");
