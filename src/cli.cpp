#include "../include/cli.hpp"

#include "../include/arg_parser.hpp"
#include "../include/candidates.hpp"
#include "../include/checksum.hpp"
#include "../include/corpus.hpp"
#include "../include/log.hpp"
#include "../include/prefix_builder.hpp"
#include "../include/vector_generator.hpp"
#include "../include/wordlist.hpp"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <limits>
#include <set>
#include <sstream>
#include <string>
#include <vector>

/**
 * @file cli.cpp
 * @brief Subcommands of the checkphrase command line tool.
 * @author Athos-0day
 * @date 2026
 */

namespace Checkphrase {

    namespace {

        const char* DEFAULT_WORDLIST = "wordlists/english.txt";
        const std::size_t MISSING_WORDS_SHOWN = 20;

        const std::set<std::string> SWITCHES = {"--verbose", "--quiet", "--no-coverage", "--help"};
        const std::set<std::string> GLOBAL_OPTIONS = {"--verbose", "--quiet", "--help", "--wordlist"};

        void printUsage(std::ostream& out) {
            out << "Usage: checkphrase <command> [options]\n"
                   "\n"
                   "Commands:\n"
                   "  derive <address>...          Print the checkphrase of each address\n"
                   "      [--length N] [--separator C]\n"
                   "  check <address> <phrase>     Compare a phrase (words or 4-letter prefixes)\n"
                   "      [--separator C]          with the address; exit 1 on mismatch\n"
                   "  verify-wordlist              Check the wordlist invariants and print its SHA-256\n"
                   "  build --existing F --candidates F --output F [--max-words N]\n"
                   "                               Add candidates whose 4-letter prefix is free\n"
                   "  filter --input F --output F [--min-score N] [--min-length N] [--max-length N]\n"
                   "                               Extract candidate words from a word<TAB>score lexicon\n"
                   "  vectors --output F [--count N] [--seed N] [--threads N]\n"
                   "      [--attempts-per-target N] [--length N] [--no-coverage]\n"
                   "                               Generate the conformance corpus\n"
                   "  replay --vectors F           Re-derive every vector of a corpus\n"
                   "\n"
                   "Global options:\n"
                   "  --wordlist F   Wordlist file (default: $CHECKPHRASE_WORDLIST, then "
                << DEFAULT_WORDLIST << ")\n"
                   "  --verbose      Log debug messages\n"
                   "  --quiet        Log errors only\n";
        }

        /**
         * @brief Reject options the command does not understand.
         * @throw ArgParseError On the first unknown option.
         */
        void requireKnownOptions(const ArgParser& args, std::set<std::string> known) {
            known.insert(GLOBAL_OPTIONS.begin(), GLOBAL_OPTIONS.end());
            auto unknown = args.unknownOptions(known);
            if (!unknown.empty())
                throw ArgParseError("Unknown option: " + unknown.front());
        }

        std::string wordlistPath(const ArgParser& args) {
            if (args.hasOption("--wordlist"))
                return args.getOption("--wordlist");

            const char* env = std::getenv("CHECKPHRASE_WORDLIST");
            if (env != nullptr && *env != '\0')
                return env;

            return DEFAULT_WORDLIST;
        }

        Wordlist loadWordlist(const ArgParser& args) {
            std::string path = wordlistPath(args);
            Logger::instance().debug("Loading wordlist from " + path);
            return Wordlist::loadFromFile(path);
        }

        char separatorOption(const ArgParser& args) {
            std::string separator = args.getOption("--separator", "-");
            if (separator.size() != 1)
                throw ArgParseError("Option --separator expects a single character");
            return separator[0];
        }

        std::string formatPercent(double value) {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(1) << value << "%";
            return oss.str();
        }

        int runDerive(const ArgParser& args, std::ostream& out) {
            requireKnownOptions(args, {"--length", "--separator"});

            const auto& positional = args.positionalArgs();
            if (positional.size() < 2)
                throw ArgParseError("derive expects at least one address");

            std::size_t length = args.getSize("--length", Checksum::DEFAULT_LENGTH);
            char separator = separatorOption(args);
            Wordlist wordlist = loadWordlist(args);

            for (std::size_t i = 1; i < positional.size(); ++i) {
                std::string phrase = Checksum::join(Checksum::derive(positional[i], wordlist, length), separator);
                if (positional.size() == 2)
                    out << phrase << '\n';
                else
                    out << positional[i] << '\t' << phrase << '\n';
            }

            return EXIT_OK;
        }

        int runCheck(const ArgParser& args, std::ostream& out) {
            requireKnownOptions(args, {"--separator"});

            const auto& positional = args.positionalArgs();
            if (positional.size() != 3)
                throw ArgParseError("check expects an address and a phrase");

            char separator = separatorOption(args);
            Wordlist wordlist = loadWordlist(args);

            if (Checksum::matches(positional[1], positional[2], wordlist, separator)) {
                out << "MATCH\n";
                return EXIT_OK;
            }

            std::size_t length = Checksum::split(positional[2], separator).size();
            out << "MISMATCH (expected "
                      << Checksum::join(Checksum::derive(positional[1], wordlist, length), separator) << ")\n";
            return EXIT_INCOMPLETE;
        }

        int runVerifyWordlist(const ArgParser& args, std::ostream& out) {
            requireKnownOptions(args, {});

            Logger& log = Logger::instance();
            std::string path = wordlistPath(args);
            auto words = Wordlist::readWords(path);
            auto violations = Wordlist::validate(words);

            for (const auto& violation : violations)
                log.error(path + ": " + violation);

            if (!violations.empty()) {
                out << "INVALID " << path << " (" << violations.size() << " violations)\n";
                return EXIT_INCOMPLETE;
            }

            Wordlist wordlist(std::move(words));
            out << "OK " << path << " " << wordlist.size() << " words sha256 " << wordlist.sha256() << '\n';
            return EXIT_OK;
        }

        int runBuild(const ArgParser& args, std::ostream& out) {
            requireKnownOptions(args, {"--existing", "--candidates", "--output", "--max-words"});

            Logger& log = Logger::instance();
            std::string existingPath = args.getOption("--existing");
            std::string candidatesPath = args.getOption("--candidates");
            std::string outputPath = args.getOption("--output");
            std::size_t maxWords = args.getSize("--max-words", PrefixBuilder::DEFAULT_MAX_WORDS);

            auto existing = PrefixBuilder::loadWordFile(existingPath);
            auto candidates = PrefixBuilder::loadWordFile(candidatesPath);
            log.info("Loaded " + std::to_string(existing.size()) + " existing words and " +
                     std::to_string(candidates.size()) + " candidates");

            BuildReport report = PrefixBuilder::build(existing, candidates, maxWords);

            for (const auto& conflict : report.existingConflicts)
                log.warn("Existing word '" + conflict.word + "' has prefix '" + conflict.prefix +
                         "' which conflicts with '" + conflict.conflictingWith + "'");

            if (log.enabled(LogLevel::Debug)) {
                for (const auto& word : report.added)
                    log.debug("Added '" + word + "' (prefix '" + Wordlist::prefixOf(word) + "')");
                for (const auto& conflict : report.rejected)
                    log.debug("Rejected '" + conflict.word + "' (prefix '" + conflict.prefix +
                              "' conflicts with '" + conflict.conflictingWith + "')");
                for (const auto& word : report.skippedHyphenated)
                    log.debug("Skipped '" + word + "' (hyphenated)");
                for (const auto& word : report.skippedWhitespace)
                    log.debug("Skipped '" + word + "' (whitespace)");
                for (const auto& word : report.skippedDuplicates)
                    log.debug("Skipped '" + word + "' (already present)");
            }

            PrefixBuilder::saveWordFile(outputPath, report.finalWords);

            log.info("Existing words: " + std::to_string(report.existingCount) +
                     ", candidates processed: " + std::to_string(report.candidatesProcessed) +
                     ", added: " + std::to_string(report.added.size()) +
                     ", rejected (prefix conflict): " + std::to_string(report.rejected.size()) +
                     ", skipped (hyphenated/whitespace/duplicate/empty): " +
                     std::to_string(report.skippedHyphenated.size()) + "/" +
                     std::to_string(report.skippedWhitespace.size()) + "/" +
                     std::to_string(report.skippedDuplicates.size()) + "/" +
                     std::to_string(report.skippedEmpty));
            log.info("Wrote " + std::to_string(report.finalWords.size()) + " words to " + outputPath);

            if (!report.complete()) {
                log.warn("Still need " + std::to_string(report.remainingCapacity()) + " more words to reach " +
                         std::to_string(maxWords));
                return EXIT_INCOMPLETE;
            }

            if (report.finalWords.size() == Wordlist::SIZE) {
                Wordlist wordlist = PrefixBuilder::finalize(report);
                log.info("Wordlist verified, sha256 " + wordlist.sha256());
            }

            return EXIT_OK;
        }

        int runFilter(const ArgParser& args, std::ostream& out) {
            requireKnownOptions(args, {"--input", "--output", "--min-score", "--min-length", "--max-length"});

            Logger& log = Logger::instance();
            FilterOptions options;
            options.minScore = args.getInt("--min-score", options.minScore);
            options.minLength = args.getSize("--min-length", options.minLength);
            options.maxLength = args.getSize("--max-length", options.maxLength);

            std::string inputPath = args.getOption("--input");
            std::string outputPath = args.getOption("--output");

            FilterReport report = CandidateFilter::filterFile(inputPath, options);

            for (auto line : report.invalidLines)
                log.debug("Skipped line " + std::to_string(line) + " of " + inputPath + " (invalid format)");

            PrefixBuilder::saveWordFile(outputPath, report.words);

            log.info("Kept " + std::to_string(report.words.size()) + " words; skipped low score: " +
                     std::to_string(report.skippedLowScore) + ", hyphenated: " +
                     std::to_string(report.skippedHyphenated) + ", spaces: " +
                     std::to_string(report.skippedSpaces) + ", too short: " +
                     std::to_string(report.skippedTooShort) + ", too long: " +
                     std::to_string(report.skippedTooLong) + ", invalid: " +
                     std::to_string(report.skippedInvalid));
            log.info("Wrote " + outputPath);

            return EXIT_OK;
        }

        int runVectors(const ArgParser& args, std::ostream& out) {
            requireKnownOptions(args, {"--output", "--count", "--seed", "--threads",
                                       "--attempts-per-target", "--length", "--no-coverage"});

            Logger& log = Logger::instance();
            GeneratorOptions options;
            options.targetCount = args.getSize("--count", options.targetCount);
            options.seed = static_cast<uint32_t>(args.getSize("--seed", options.seed));
            std::size_t threads = args.getSize("--threads", options.threads);
            if (threads == 0 || threads > std::numeric_limits<unsigned int>::max())
                throw ArgParseError("Option --threads expects a positive thread count");
            options.threads = static_cast<unsigned int>(threads);
            options.attemptsPerTarget = args.getSize("--attempts-per-target", options.attemptsPerTarget);
            options.checksumLength = args.getSize("--length", options.checksumLength);
            options.ensureFullCoverage = !args.hasOption("--no-coverage");

            std::string outputPath = args.getOption("--output");
            Wordlist wordlist = loadWordlist(args);

            unsigned int workers = VectorGenerator::effectiveThreads(options.threads);
            if (workers != options.threads)
                log.warn("Using " + std::to_string(workers) + " threads instead of " + std::to_string(options.threads));

            log.info("Generating test vectors (target " + std::to_string(options.targetCount) +
                     ", seed " + std::to_string(options.seed) + ", " +
                     std::to_string(workers) + " thread(s))");

            GenerationResult result = VectorGenerator::generate(wordlist, options);
            const CorpusStatistics& stats = result.corpus.statistics;

            log.info("Generated " + std::to_string(stats.totalVectors) + " test vectors in " +
                     std::to_string(result.attempts) + " attempts");
            log.info("Word coverage: " + std::to_string(stats.wordsCovered) + "/" +
                     std::to_string(stats.totalWords) + " (" + formatPercent(stats.coveragePercent) + ")");

            Corpus::save(outputPath, result.corpus);
            log.info("Saved test vectors to " + outputPath);

            if (result.status == GenerationStatus::CoverageIncomplete) {
                std::string sample;
                for (std::size_t i = 0; i < result.missingWords.size() && i < MISSING_WORDS_SHOWN; ++i)
                    sample += (i == 0 ? "" : ", ") + result.missingWords[i];
                log.warn("Attempt budget exhausted; missing " + std::to_string(result.missingWords.size()) +
                         " words: " + sample + (result.missingWords.size() > MISSING_WORDS_SHOWN ? ", ..." : ""));
                return EXIT_INCOMPLETE;
            }

            return EXIT_OK;
        }

        int runReplay(const ArgParser& args, std::ostream& out) {
            requireKnownOptions(args, {"--vectors"});

            Logger& log = Logger::instance();
            std::string vectorsPath = args.getOption("--vectors");
            ConformanceCorpus corpus = Corpus::load(vectorsPath);
            Wordlist wordlist = loadWordlist(args);

            log.info("Replaying " + std::to_string(corpus.testCases.size()) + " test vectors from " + vectorsPath);

            auto mismatches = Corpus::replay(corpus, wordlist);
            for (const auto& mismatch : mismatches) {
                if (!mismatch.error.empty()) {
                    log.error("FAIL #" + std::to_string(mismatch.index) + " " + mismatch.address +
                              ": " + mismatch.error);
                    continue;
                }
                log.error("FAIL #" + std::to_string(mismatch.index) + " " + mismatch.address +
                          ": expected " + Checksum::join(mismatch.expected) +
                          ", got " + Checksum::join(mismatch.actual));
            }

            std::size_t passed = corpus.testCases.size() - mismatches.size();
            out << passed << " passed, " << mismatches.size() << " failed\n";

            return mismatches.empty() ? EXIT_OK : EXIT_INCOMPLETE;
        }
    }

    int runCli(int argc, const char* const argv[], std::ostream& out) {
        Logger& log = Logger::instance();

        try {
            ArgParser args(argc, argv, SWITCHES);

            if (args.hasOption("--verbose"))
                log.setThreshold(LogLevel::Debug);
            if (args.hasOption("--quiet"))
                log.setThreshold(LogLevel::Error);

            const auto& positional = args.positionalArgs();
            if (args.hasOption("--help")) {
                printUsage(out);
                return EXIT_OK;
            }
            if (positional.empty()) {
                printUsage(std::cerr);
                return EXIT_USAGE;
            }

            const std::string& command = positional.front();
            if (command == "derive")
                return runDerive(args, out);
            if (command == "check")
                return runCheck(args, out);
            if (command == "verify-wordlist")
                return runVerifyWordlist(args, out);
            if (command == "build")
                return runBuild(args, out);
            if (command == "filter")
                return runFilter(args, out);
            if (command == "vectors")
                return runVectors(args, out);
            if (command == "replay")
                return runReplay(args, out);

            throw ArgParseError("Unknown command: " + command);
        } catch (const ArgParseError& e) {
            log.error(e.what());
            printUsage(std::cerr);
            return EXIT_USAGE;
        } catch (const CheckphraseException& e) {
            log.error(e.what());
            return EXIT_FATAL;
        } catch (const std::exception& e) {
            log.error(std::string("Unexpected error: ") + e.what());
            return EXIT_FATAL;
        }
    }

}
