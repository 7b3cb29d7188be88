#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

extern bool debug;

// echo every executed command to stderr as "+ cmd args..."
void set_command_trace(bool enabled);
std::string command_line(const std::string& cmd, const std::vector<std::string>& args);

int fork(std::function<int()> func);
int exec(const std::string& cmd, const std::vector<std::string>& args);

struct PipelineStatus {
    int producer;
    int consumer;
    bool ok() const { return producer == 0 && consumer == 0; }
};

// producer's stdout is connected to consumer's stdin
PipelineStatus exec_pipeline(const std::string& producer, const std::vector<std::string>& producer_args,
    const std::string& consumer, const std::vector<std::string>& consumer_args);

std::string default_search_path();
std::optional<std::filesystem::path> find_in_path(const std::string& name,
    const std::string& search_path = default_search_path());

struct Provider {
    std::string name;
    std::vector<std::string> args; // prepended to every invocation
};

struct ResolvedProvider {
    Provider provider;
    std::filesystem::path path;
};

// first provider found on the search path wins
std::optional<ResolvedProvider> resolve_provider(const std::vector<Provider>& providers,
    const std::string& search_path = default_search_path());

void install_termination_handlers();
// throws Interrupted once SIGHUP, SIGINT or SIGTERM has been received;
// fork() and exec_pipeline() call it before starting a child
void check_interrupted();
