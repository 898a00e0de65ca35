// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//

// command line front-end of the scoring engine

#include <ldsi/Init.hpp>
#include <ldsi/Ldsi.hpp>
#include <ldsi/TextSample.hpp>
#include <ldsi/TextCleaner.hpp>
#include <ldsi/Tokenizer.hpp>
#include <ldsi/ResultJson.hpp>
#include <ldsi/Audit.hpp>

// logging
#include <jalog/Instance.hpp>
#include <jalog/sinks/DefaultSink.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

const char* Usage = R"(usage:
  ldsi analyze -a <file|text> -b <file|text> [options]
      --clean              tokenize with the stopword filtering cleaner
      --output <file>      append an audit entry to file
      --config <file>      json scoring config
      --alpha <x>          ncd coefficient
      --beta <x>           entropy coefficient
      --gamma <x>          topology coefficient
      --strategy <s>       topology strategy: absolute or delta
      --json               print the result as json
  ldsi ncd <file|text> <file|text>
  ldsi entropy <file|text>
  ldsi topology <file|text>
  ldsi info

lambda bands (defaults):
  [0.0, 0.3)  ZOMBIE     the model recites
  [0.3, 0.7)  REBEL      notable divergence
  [0.7, 1.2)  ARCHITECT  optimal zone
  [1.2, inf)  FOOL       chaos
)";

// thrown for command line errors (exit code 2)
struct UsageError : public std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// an existing file is read, anything else is taken as literal text
std::string loadText(const std::string& pathOrText) {
    std::error_code ec;
    if (!fs::is_regular_file(pathOrText, ec)) return pathOrText;

    std::ifstream fin(pathOrText, std::ios::binary);
    if (!fin) {
        throw std::runtime_error("Can't read " + pathOrText);
    }
    std::ostringstream ss;
    ss << fin.rdbuf();
    return ss.str();
}

double parseDouble(const std::string& str, const char* name) {
    size_t idx = 0;
    double value = 0;
    try {
        value = std::stod(str, &idx);
    }
    catch (std::logic_error&) {
        throw UsageError(std::string("Invalid value for ") + name + ": " + str);
    }
    if (idx != str.size()) {
        throw UsageError(std::string("Extra characters after ") + name + " value: " + str);
    }
    return value;
}

class Args {
public:
    Args(int argc, char* argv[]) : m_args(argv + 1, argv + argc) {}

    bool done() const { return m_pos == m_args.size(); }

    const std::string& next(const char* what) {
        if (done()) throw UsageError(std::string("Missing ") + what);
        return m_args[m_pos++];
    }

    void expectEnd() const {
        if (!done()) throw UsageError("Unexpected argument " + m_args[m_pos]);
    }

private:
    std::vector<std::string> m_args;
    size_t m_pos = 0;
};

ldsi::TextSample makeSample(std::string text, bool clean) {
    if (!clean) return ldsi::TextSample(std::move(text));
    auto tokens = ldsi::TextCleaner().cleanTokens(text);
    return ldsi::TextSample(std::move(text), std::move(tokens));
}

void printResult(const ldsi::LdsiResult& r) {
    const std::string rule(60, '=');
    const std::string thin(60, '-');
    auto& out = std::cout;
    out << std::fixed << std::setprecision(4);

    out << rule << '\n';
    out << "  LDSI\n";
    out << rule << "\n\n";
    out << "  lambda:  " << r.lambda << '\n';
    out << "  verdict: " << ldsi::verdictDescription(r.verdict) << "\n\n";

    out << thin << '\n';
    out << "  [ncd]\n";
    out << "    raw:               " << r.ncd.raw << '\n';
    out << "    damping factor:    " << r.ncd.dampingFactor << '\n';
    out << "    corrected:         " << r.ncd.corrected << '\n';
    out << "    C(a):              " << r.ncd.sizeA << " bytes\n";
    out << "    C(b):              " << r.ncd.sizeB << " bytes\n";
    out << "    C(ab):             " << r.ncd.sizeCombined << " bytes\n";

    out << "  [entropy]\n";
    out << "    H(a):              " << r.entropyA.shannon << " bits\n";
    out << "    H(b):              " << r.entropyB.shannon << " bits\n";
    out << "    H(b)/H(a):         " << r.entropyRatio << '\n';
    out << "    term:              " << r.entropyTerm << '\n';
    out << "    ttr a / b:         " << r.entropyA.ttr << " / " << r.entropyB.ttr << '\n';
    out << "    hapax a / b:       " << r.entropyA.hapaxRatio << " / " << r.entropyB.hapaxRatio << '\n';

    out << "  [topology] " << ldsi::toString(r.topologyStrategy) << '\n';
    out << "    structural quality " << r.structuralQuality << '\n';
    out << "    delta:             " << r.topologyDelta << '\n';
    out << "    density a / b:     " << r.topologyA.density << " / " << r.topologyB.density << '\n';
    out << "    lcc ratio a / b:   " << r.topologyA.lccRatio << " / " << r.topologyB.lccRatio << '\n';
    out << "    clustering a / b:  " << r.topologyA.clustering << " / " << r.topologyB.clustering << '\n';
    out << "    small world a / b: " << r.topologyA.smallWorldIndex << " / " << r.topologyB.smallWorldIndex << '\n';

    out << thin << '\n';
    out << std::setprecision(2);
    out << "  coefficients: alpha = " << r.coefficients.alpha
        << ", beta = " << r.coefficients.beta
        << ", gamma = " << r.coefficients.gamma << '\n';
    out << rule << '\n';
}

int analyze(Args& args) {
    std::optional<std::string> argA, argB, output, configPath, strategy;
    std::optional<double> alpha, beta, gamma;
    bool clean = false;
    bool json = false;

    while (!args.done()) {
        auto& arg = args.next("argument");
        if (arg == "-a" || arg == "--text-a") argA = args.next("value of -a");
        else if (arg == "-b" || arg == "--text-b") argB = args.next("value of -b");
        else if (arg == "-c" || arg == "--clean") clean = true;
        else if (arg == "-o" || arg == "--output") output = args.next("value of --output");
        else if (arg == "--config") configPath = args.next("value of --config");
        else if (arg == "--alpha") alpha = parseDouble(args.next("value of --alpha"), "--alpha");
        else if (arg == "--beta") beta = parseDouble(args.next("value of --beta"), "--beta");
        else if (arg == "--gamma") gamma = parseDouble(args.next("value of --gamma"), "--gamma");
        else if (arg == "--strategy") strategy = args.next("value of --strategy");
        else if (arg == "--json") json = true;
        else throw UsageError("Unknown option " + arg);
    }

    if (!argA || !argB) {
        throw UsageError("analyze requires -a and -b");
    }

    ldsi::ScoringConfig config;
    if (configPath) config = ldsi::loadConfig(*configPath);
    if (alpha) config.coefficients.alpha = *alpha;
    if (beta) config.coefficients.beta = *beta;
    if (gamma) config.coefficients.gamma = *gamma;
    if (strategy) {
        auto s = ldsi::topologyStrategyFromString(*strategy);
        if (!s) throw UsageError("Unknown strategy " + *strategy);
        config.topologyStrategy = *s;
    }

    auto start = std::chrono::steady_clock::now();

    auto a = makeSample(loadText(*argA), clean);
    auto b = makeSample(loadText(*argB), clean);
    auto result = ldsi::computeLdsi(a, b, config);

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    if (json) {
        std::cout << ldsi::toJson(result).dump(2) << '\n';
    }
    else {
        printResult(result);
    }

    if (output) {
        auto entry = ldsi::AuditLogger::createEntry("local-analysis", *argA, *argB, a.text(), b.text(),
            result, uint64_t(duration.count()));
        ldsi::AuditLogger::writeSingle(entry, *output);
        std::cerr << "audit entry " << entry.testId << " written to " << *output << '\n';
    }

    return 0;
}

int ncd(Args& args) {
    auto a = ldsi::TextSample(loadText(args.next("text a")));
    auto b = ldsi::TextSample(loadText(args.next("text b")));
    args.expectEnd();

    auto m = ldsi::computeNcd(a.bytes(), b.bytes());
    std::cout << ldsi::toJson(m).dump(2) << '\n';
    return 0;
}

int entropy(Args& args) {
    auto s = ldsi::TextSample(loadText(args.next("text")));
    args.expectEnd();

    auto m = ldsi::computeEntropy(s.tokens());
    auto j = ldsi::toJson(m);
    j["bigram_entropy"] = ldsi::computeNgramEntropy(s.tokens(), 2);
    std::cout << j.dump(2) << '\n';
    return 0;
}

int topology(Args& args) {
    auto s = ldsi::TextSample(loadText(args.next("text")));
    args.expectEnd();

    auto m = ldsi::analyzeTopology(s.tokens());
    std::cout << ldsi::toJson(m).dump(2) << '\n';
    return 0;
}

int info(Args& args) {
    args.expectEnd();

    ldsi::ScoringConfig defaults;
    std::cout << "ldsi " << ldsi::version() << "\n";
    std::cout << "deterministic divergence index of two texts: compression distance,\n"
                 "lexical entropy and co-occurrence graph structure\n\n";
    std::cout << "default config:\n" << ldsi::toJson(defaults).dump(2) << '\n';
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    jalog::Instance jl;
    jl.setup().add<jalog::sinks::DefaultSink>();

    try {
        ldsi::initLibrary();

        Args args(argc, argv);
        if (args.done()) {
            std::cerr << Usage;
            return 2;
        }

        auto& cmd = args.next("command");
        if (cmd == "analyze") return analyze(args);
        if (cmd == "ncd") return ncd(args);
        if (cmd == "entropy") return entropy(args);
        if (cmd == "topology") return topology(args);
        if (cmd == "info") return info(args);
        if (cmd == "help" || cmd == "--help" || cmd == "-h") {
            std::cout << Usage;
            return 0;
        }

        throw UsageError("Unknown command " + cmd);
    }
    catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << Usage;
        return 2;
    }
    catch (const std::invalid_argument& e) {
        std::cerr << "Invalid input: " << e.what() << std::endl;
        return 2;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
