#include "classification_resolver.h"

#include "common/logging.h"

namespace ArchGate {

auto ClassificationResolver::classifyFile(const ClassificationMap& map, const std::string& file,
                                          std::vector<size_t>* winners, Diagnostic* diagnostic) noexcept -> bool {
    winners->clear();
    size_t best_len = 0;

    for (size_t i = 0; i < map.rules.size(); ++i) {
        const std::string& prefix = map.rules[i].prefix;
        if (file.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        if (winners->empty() || prefix.size() > best_len) {
            winners->assign(1, i);
            best_len = prefix.size();
        } else if (prefix.size() == best_len) {
            winners->push_back(i);
        }
    }

    if (winners->empty()) {
        return fail(diagnostic, ErrorKind::CLASSIFICATION, file, 0, "no classification rule matches this file");
    }
    // Equal-length rules are only ambiguous when they disagree
    const size_t first = winners->front();
    for (size_t other : *winners) {
        if (map.rules[other].classification != map.rules[first].classification) {
            return fail(diagnostic, ErrorKind::CLASSIFICATION, file, 0,
                        "ambiguous classification: rules[" + std::to_string(first) + "] and rules[" +
                            std::to_string(other) + "] both match with prefix length " + std::to_string(best_len));
        }
    }
    return true;
}

auto ClassificationResolver::classify(const ClassificationMap& map, const std::vector<std::string>& files,
                                      ClassificationAssignment* out, Diagnostic* diagnostic) noexcept -> bool {
    std::vector<uint32_t> wins(map.rules.size(), 0);
    std::vector<size_t> winners;
    out->by_file.clear();

    for (const auto& file : files) {
        if (!classifyFile(map, file, &winners, diagnostic)) {
            return false;
        }
        for (size_t winner : winners) {
            ++wins[winner];
        }
        out->by_file[file] = map.rules[winners.front()].classification;
    }

    for (size_t i = 0; i < wins.size(); ++i) {
        if (wins[i] == 0) {
            return fail(diagnostic, ErrorKind::CLASSIFICATION, map.source, 0,
                        "rules[" + std::to_string(i) + "] (prefix '" + map.rules[i].prefix +
                            "') is the most specific rule for no file");
        }
    }

    size_t core = 0;
    for (const auto& [file, c] : out->by_file) {
        if (c == Common::Classification::CORE) ++core;
    }
    LOG_INFO("Classified %zu files: %zu core, %zu boundary", out->by_file.size(), core, out->by_file.size() - core);
    return true;
}

} // namespace ArchGate
