#pragma once

#include "args.h"
#include "kokoro_tts.h"

void add_connection_args(arg_list & args);
void add_synthesis_args(arg_list & args);
void add_log_level_arg(arg_list & args);

// Registers everything kokoro_from_args and parse_connect_options read.
void add_common_args(arg_list & args);

// Program description followed by the model and voice ids the server is known to accept, for '--help'.
std::string usage_with_known_ids(const std::string & description);

void apply_log_level(const arg_list & args);

http_client_options parse_http_client_options(const arg_list & args);
api_connect_options parse_connect_options(const arg_list & args);
synthesis_options parse_synthesis_options(const arg_list & args);

unique_ptr<kokoro_tts> kokoro_from_args(const arg_list & args);
