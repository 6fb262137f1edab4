// Pair quote harness
// -----------------------------------------------------
// Replays JSON action sequences (swaps, liquidity quotes) against JSON pair
// snapshots and writes every intermediate snapshot to a results file, so the
// integer math can be diffed against an on-chain or scripted reference.
//
#include "cpswap/pair_harness.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace json = boost::json;

namespace {

json::value load_json(const std::string& path, const char* what) {
    std::ifstream stream(path);
    if (!stream) {
        throw std::runtime_error(std::string("Cannot open ") + what + " file: " + path);
    }
    std::string contents((std::istreambuf_iterator<char>(stream)),
                         std::istreambuf_iterator<char>());
    return json::parse(contents);
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc != 4) {
        std::cerr << "Usage: " << argv[0] << " <pairs.json> <sequences.json> <output_results.json>" << std::endl;
        return 1;
    }

    std::string pairs_file = argv[1];
    std::string sequences_file = argv[2];
    std::string output_file = argv[3];

    try {
        json::array pairs = load_json(pairs_file, "pairs").as_object().at("pairs").as_array();
        json::array sequences = load_json(sequences_file, "sequences").as_object().at("sequences").as_array();
        if (sequences.empty()) {
            throw std::runtime_error("No sequences found in " + sequences_file);
        }

        const char* only_pair = std::getenv("FILTER_PAIR");
        const char* only_seq = std::getenv("FILTER_SEQUENCE");
        bool save_last_only = false;
        if (const char* env = std::getenv("SAVE_LAST_ONLY")) {
            save_last_only = std::string(env) == "1";
        }

        json::array results;
        for (const auto& pair_value : pairs) {
            const auto& pair_obj = pair_value.as_object();
            std::string pair_name = pair_obj.at("name").as_string().c_str();
            if (only_pair && pair_name != std::string(only_pair)) continue;

            for (const auto& seq_value : sequences) {
                const auto& seq_obj = seq_value.as_object();
                std::string seq_name = seq_obj.at("name").as_string().c_str();
                if (only_seq && seq_name != std::string(only_seq)) continue;

                std::cout << "Processing " << pair_name << " with " << seq_name << "..." << std::endl;
                json::object run;
                run["pair_config"] = pair_name;
                run["sequence"] = seq_name;
                run["result"] = cpswap::harness::process_pair_sequence(pair_obj, seq_obj, save_last_only);
                results.push_back(std::move(run));
            }
        }

        json::object output;
        output["metadata"] = {
            {"pairs_file", pairs_file},
            {"sequences_file", sequences_file},
            {"num_pairs", pairs.size()},
            {"num_sequences", sequences.size()},
            {"total_runs", results.size()}
        };
        output["results"] = std::move(results);

        std::ofstream out_file(output_file);
        if (!out_file) {
            throw std::runtime_error("Cannot open output file: " + output_file);
        }
        out_file << json::serialize(output) << std::endl;

        std::cout << "Processed " << output["metadata"].as_object().at("total_runs").as_uint64()
                  << " pair-sequence combinations" << std::endl;
        std::cout << "Results written to " << output_file << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
