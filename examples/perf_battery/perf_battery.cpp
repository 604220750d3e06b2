#include <stdio.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

#include "args_common.h"

/*
 * These are the 'Harvard Sentences' (https://en.wikipedia.org/wiki/Harvard_sentences). They are phonetically
 * balanced sentences typically used for standardized testing of voice over cellular and telephone systems.
 */
std::vector<std::string> TEST_SENTENCES = {
	"The birch canoe slid on the smooth planks.",
	"Glue the sheet to the dark blue background.",
	"It's easy to tell the depth of a well.",
	"These days a chicken leg is a rare dish.",
	"Rice is often served in round bowls.",
	"The juice of lemons makes fine punch.",
	"The box was thrown beside the parked truck.",
	"The hogs were fed chopped corn and garbage.",
	"Four hours of steady work faced us.",
	"A large size in stockings is hard to sell.",
	"The boy was there when the sun rose.",
	"A rod is used to catch pink salmon.",
	"The source of the huge river is the clear spring.",
	"Kick the ball straight and follow through.",
	"Help the woman get back to her feet.",
	"A pot of tea helps to pass the evening.",
	"Smoky fires lack flame and heat.",
	"The soft cushion broke the man's fall.",
	"The salt breeze came across from the sea.",
	"The girl at the booth sold fifty bonds.",
	"The small pup gnawed a hole in the sock.",
	"The fish twisted and turned on the bent hook.",
	"Press the pants and sew a button on the vest.",
	"The swan dive was far short of perfect.",
	"The beauty of the view stunned the young boy.",
	"Two blue fish swam in the tank.",
	"Her purse was full of useless trash.",
	"The colt reared and threw the tall rider.",
	"It snowed, rained, and hailed the same morning.",
	"Read verse out loud for pleasure."
};

struct synthesis_sample {
	double first_frame_ms = 0.0;
	double total_ms = 0.0;
	double audio_ms = 0.0;
};

double mean(const std::vector<double> & series) {
	if (series.empty()) {
		return 0.0;
	}
	double sum = 0.0;
	for (double v : series) {
		sum += v;
	}
	return (double) sum / series.size();
}

synthesis_sample benchmark_sentence(kokoro_tts & synthesizer, const std::string & sentence, const api_connect_options & conn_options) {
	synthesis_sample sample;
	const auto start = std::chrono::steady_clock::now();
	const unique_ptr<chunked_stream> stream{synthesizer.synthesize(sentence, conn_options)};
	synthesized_audio event;
	bool first = true;
	while (stream->next(event)) {
		if (first) {
			std::chrono::duration<double, std::milli> ttfb = std::chrono::steady_clock::now() - start;
			sample.first_frame_ms = ttfb.count();
			first = false;
		}
		sample.audio_ms += event.frame.duration() * 1000.0;
	}
	std::chrono::duration<double, std::milli> total = std::chrono::steady_clock::now() - start;
	sample.total_ms = total.count();
	return sample;
}

std::string benchmark_printout(const synthesis_options & options, int n_parallel, const std::vector<synthesis_sample> & samples, int failures) {
	std::vector<double> first_frame;
	std::vector<double> totals;
	std::vector<double> real_time_factors;
	for (const auto & sample : samples) {
		first_frame.push_back(sample.first_frame_ms);
		totals.push_back(sample.total_ms);
		if (sample.audio_ms > 0.0) {
			real_time_factors.push_back(sample.total_ms / sample.audio_ms);
		}
	}
	std::string printout = (std::string) "Mean Stats for model " + options.model + " with voice " + options.voice +
		" (" + std::to_string(n_parallel) + " parallel stream(s)):\n\n";
	printout += (std::string) "  Time To First Frame (ms):         " + std::to_string(mean(first_frame)) + "\n";
	printout += (std::string) "  Synthesis Time (ms):              " + std::to_string(mean(totals)) + "\n";
	printout += (std::string) "  Synthesis Real Time Factor:       " + std::to_string(mean(real_time_factors)) + "\n";
	printout += (std::string) "  Failed Requests:                  " + std::to_string(failures) + "\n";
	return printout;
}

int main(int argc, const char ** argv) {
	const std::string usage{usage_with_known_ids("Benchmarks a Kokoro server with the Harvard sentences.")};
	arg_list args{usage.c_str()};
	add_common_args(args);
	args.add({1, "n-parallel", "np", "The number of synthesis streams to run at the same time against the shared connection pool"});
	args.parse(argc, argv);
	apply_log_level(args);

	const int n_parallel{args["n-parallel"]};
	if (n_parallel < 1) {
		fprintf(stderr, "The '--n-parallel' value must be at least 1. It was set to '%d'.\n", n_parallel);
		exit(1);
	}

	const api_connect_options conn_options{parse_connect_options(args)};
	const unique_ptr<kokoro_tts> synthesizer{kokoro_from_args(args)};

	std::mutex samples_mutex;
	std::vector<synthesis_sample> samples;
	std::atomic<size_t> next_sentence{0};
	std::atomic<int> failures{0};

	const auto worker = [&] {
		for (size_t i = next_sentence++; i < TEST_SENTENCES.size(); i = next_sentence++) {
			try {
				const synthesis_sample sample = benchmark_sentence(*synthesizer, TEST_SENTENCES[i], conn_options);
				std::lock_guard<std::mutex> lock(samples_mutex);
				samples.push_back(sample);
			} catch (const api_error & e) {
				KOKORO_LOG_ERROR("Synthesis of sentence %zu failed: %s", i, e.what());
				failures++;
			}
		}
	};

	std::vector<std::thread> threads;
	for (int i = 0; i < n_parallel; i++) {
		threads.emplace_back(worker);
	}
	for (auto & thread : threads) {
		thread.join();
	}

	fprintf(stdout, "%s", benchmark_printout(synthesizer->options(), n_parallel, samples, failures.load()).c_str());
	return failures.load() == 0 ? 0 : 1;
}
