/**
 * @file similarity_manager.cpp
 * @brief Detection run: validate, build, detect, aggregate, score, rank
 */

#include <similarity/similarity_manager.hpp>
#include <detectors/similarity_detector.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <algorithm>
#include <cmath>
#include <exception>
#include <iomanip>
#include <set>
#include <sstream>
#include <unordered_map>

namespace Twinscan {

static std::string fixed4(double v) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4) << v;
    return ss.str();
}

static bool in_unit_interval(double v) {
    return std::isfinite(v) && v > 0.0 && v <= 1.0;
}

static void check_cancel(const CancellationToken* cancel, const char* stage) {
    if (cancel && cancel->is_cancelled()) throw OperationCancelled(stage);
}

std::vector<DetectorId> SimilarityManager::resolve_detectors(const SimilarityOptions& options) {
    if (options.enabled_detectors.empty())
        return {ALL_DETECTORS.begin(), ALL_DETECTORS.end()};

    std::set<DetectorId> chosen;
    for (const auto& name : options.enabled_detectors) {
        auto id = parse_detector_id(name);
        if (!id) throw InvalidOptionsError("unknown detector '" + name + "'");
        chosen.insert(*id);
    }
    return {chosen.begin(), chosen.end()};
}

void SimilarityManager::validate(const SimilarityOptions& options) {
    if (!in_unit_interval(options.threshold))
        throw InvalidOptionsError("threshold must be in (0, 1], got " + fixed4(options.threshold));
    if (options.min_lines < 0)
        throw InvalidOptionsError("min_lines must be >= 0, got " + std::to_string(options.min_lines));

    const auto detectors = resolve_detectors(options);

    const auto& strategy = options.consensus;
    if (strategy.kind() == ConsensusStrategy::Kind::Majority ||
        strategy.kind() == ConsensusStrategy::Kind::Weighted) {
        if (!in_unit_interval(strategy.threshold()))
            throw InvalidOptionsError(strategy.name() + " threshold must be in (0, 1], got " +
                                      fixed4(strategy.threshold()));
    }
    if (strategy.kind() == ConsensusStrategy::Kind::Weighted) {
        if (strategy.weights().empty())
            throw InvalidOptionsError("weighted strategy needs at least one weight");
        for (const auto& [detector, weight] : strategy.weights()) {
            if (!std::isfinite(weight) || weight < 0.0)
                throw InvalidOptionsError(std::string("weight for '") + to_string(detector) + "' must be finite and >= 0");
            if (std::find(detectors.begin(), detectors.end(), detector) == detectors.end())
                throw AggregationError(std::string("weight given for detector '") + to_string(detector) +
                                       "' which is not enabled");
        }
    }

    const auto& fp = options.fingerprint;
    if (fp.bits != 64 && fp.bits != 128)
        throw InvalidOptionsError("fingerprint bits must be 64 or 128, got " + std::to_string(fp.bits));
    if (fp.min_ngram == 0 || fp.min_ngram > fp.max_ngram)
        throw InvalidOptionsError("n-gram range must satisfy 1 <= min <= max");

    const auto& lsh = options.lsh;
    if (lsh.bands == 0 || fp.bits % lsh.bands != 0)
        throw InvalidOptionsError("LSH bands (" + std::to_string(lsh.bands) + ") must divide fingerprint bits (" +
                                  std::to_string(fp.bits) + ")");
    if (fp.bits / lsh.bands > 64)
        throw InvalidOptionsError("LSH band width exceeds 64 bits");

    double weight_sum = 0.0;
    for (double w : options.structural.weights) {
        if (!std::isfinite(w) || w < 0.0)
            throw InvalidOptionsError("structural weights must be finite and >= 0");
        weight_sum += w;
    }
    if (weight_sum <= 0.0)
        throw InvalidOptionsError("structural weights must not all be zero");
    if (!(options.structural.bucket_growth > 1.0) || !std::isfinite(options.structural.bucket_growth))
        throw InvalidOptionsError("structural bucket growth must be > 1");

    if (options.ann.top_k == 0)
        throw InvalidOptionsError("ANN top_k must be >= 1");
    if (options.ann.hnsw.M < 2 || options.ann.hnsw.ef_construction == 0 || options.ann.hnsw.ef_search == 0)
        throw InvalidOptionsError("HNSW parameters must be positive (M >= 2)");

    const auto& cc = options.confidence;
    for (double v : {cc.same_name_bonus, cc.overload_penalty, cc.large_group_penalty}) {
        if (!std::isfinite(v) || v < 0.0)
            throw InvalidOptionsError("confidence adjustments must be finite and >= 0");
    }
    if (options.canonicalizer.max_depth == 0)
        throw InvalidOptionsError("canonicalizer max_depth must be >= 1");
}

RefactoringImpact SimilarityManager::refactoring_impact(double average_complexity, uint64_t combined_lines) {
    if (average_complexity > 8.0 && combined_lines > 100) return RefactoringImpact::High;
    if (average_complexity > 5.0 || combined_lines > 50) return RefactoringImpact::Medium;
    return RefactoringImpact::Low;
}

std::vector<SimilarityGroup> SimilarityManager::detect_similarities(const std::vector<FunctionInfo>& functions,
                                                                    const SimilarityOptions& options,
                                                                    const CancellationToken* cancel) const {
    return run(functions, options, cancel).groups;
}

DetectorRun SimilarityManager::run_detectors(const std::vector<std::unique_ptr<SimilarityDetector>>& detectors,
                                             const std::vector<FunctionRepresentation>& reps,
                                             const DetectorOptions& options) {
    std::vector<DetectorResult> results(detectors.size());
    std::vector<std::exception_ptr> failures(detectors.size());

    #pragma omp parallel for schedule(dynamic, 1)
    for (int64_t i = 0; i < static_cast<int64_t>(detectors.size()); ++i) {
        try {
            results[i] = detectors[i]->detect(reps, options);
        } catch (...) {
            failures[i] = std::current_exception();
        }
    }

    DetectorRun run;
    for (size_t i = 0; i < detectors.size(); ++i) {
        const DetectorId id = detectors[i]->id();
        if (failures[i]) {
            std::string message;
            try {
                std::rethrow_exception(failures[i]);
            } catch (const std::exception& ex) {
                message = ex.what();
            } catch (...) {
                message = "non-standard exception";
            }
            run.warnings.push_back({id, WarningKind::DetectorFailed, std::move(message)});
            run.degraded.insert(id);
            continue;
        }

        bool unavailable = false;
        for (auto& w : results[i].warnings) {
            if (w.kind == WarningKind::DetectorUnavailable) unavailable = true;
            run.warnings.push_back(std::move(w));
        }
        if (unavailable) {
            run.degraded.insert(id);
            continue;
        }
        Logger::info(std::string(detectors[i]->name()) + ": " + std::to_string(results[i].pairs.size()) + " pairs");
        run.pairs.emplace(id, std::move(results[i].pairs));
        run.ran.push_back(id);
    }
    return run;
}

DetectionReport SimilarityManager::run(const std::vector<FunctionInfo>& functions,
                                       const SimilarityOptions& options,
                                       const CancellationToken* cancel) const {
    DetectionReport report;
    report.function_count = functions.size();
    Timer timer;

    auto mark = [&](const char* stage) {
        report.stage_timings.push_back({stage, timer.elapsed_ms()});
        timer.reset();
    };

    // ---------------- validate ----------------
    check_cancel(cancel, "validate");
    validate(options);
    const auto requested = resolve_detectors(options);
    const bool explicit_set = !options.enabled_detectors.empty();
    mark("validate");

    // ---------------- build ----------------
    check_cancel(cancel, "build");
    Logger::step("Building representations for " + std::to_string(functions.size()) + " functions");
    RepresentationBuilder builder(options);
    BuildResult built = builder.build(functions, provider_, cache_);
    report.skipped = std::move(built.skipped);
    report.representation_count = built.representations.size();
    if (cache_) report.cache_stats = cache_->stats();
    for (const auto& skip : report.skipped) {
        Logger::warn("Skipped " + (skip.function_id.empty() ? std::string("<no id>") : skip.function_id) +
                     ": " + skip.reason + " (" + skip.detail + ")");
    }
    mark("build");

    const auto& reps = built.representations;

    // ---------------- detect ----------------
    check_cancel(cancel, "detect");
    std::vector<std::unique_ptr<SimilarityDetector>> detectors;
    for (DetectorId id : requested) {
        auto detector = make_detector(id);
        if (!explicit_set && !detector->is_available(reps)) {
            report.warnings.push_back({id, WarningKind::DetectorUnavailable,
                                       "inputs not available; left out of the default set"});
            continue;
        }
        detectors.push_back(std::move(detector));
    }

    DetectorRun detected = run_detectors(detectors, reps, options.detector_options());
    PairsByDetector& per_detector = detected.pairs;
    const std::set<DetectorId>& degraded = detected.degraded;
    report.detectors_run = std::move(detected.ran);
    for (auto& w : detected.warnings) report.warnings.push_back(std::move(w));
    for (const auto& w : report.warnings) {
        Logger::warn(std::string(to_string(w.detector)) + " [" + to_string(w.kind) + "] " + w.message);
    }
    mark("detect");

    // ---------------- aggregate ----------------
    check_cancel(cancel, "aggregate");
    ConsensusStrategy strategy = options.consensus;
    if (strategy.kind() == ConsensusStrategy::Kind::Weighted && !degraded.empty()) {
        std::map<DetectorId, double> weights;
        for (const auto& [d, w] : strategy.weights()) {
            if (!degraded.count(d)) weights.emplace(d, w);
        }
        strategy = strategy.with_weights(std::move(weights));
    }
    ConsensusAggregator aggregator;
    std::vector<SimilarityGroup> groups = aggregator.aggregate(per_detector, strategy);
    mark("aggregate");

    // ---------------- confidence ----------------
    check_cancel(cancel, "confidence");
    std::unordered_map<std::string, const FunctionRepresentation*> by_id;
    for (const auto& rep : reps) by_id.emplace(rep.function_id, &rep);

    ConfidenceCalculator calculator(options.confidence);
    std::vector<ConfidenceResult> all_scores;

    for (auto& group : groups) {
        std::map<std::string, std::set<BLAKE3Pipeline::Hash>> signatures_by_name;
        uint64_t combined_lines = 0;
        double complexity_sum = 0.0;
        for (const auto& member : group.members) {
            const auto* rep = by_id.at(member);
            signatures_by_name[rep->name].insert(rep->signature_hash);
            combined_lines += rep->line_count;
            complexity_sum += rep->complexity;
        }

        double confidence_sum = 0.0;
        for (auto& edge : group.edges) {
            const auto* a = by_id.at(edge.first);
            const auto* b = by_id.at(edge.second);

            ConfidenceContext ctx{a->name, b->name, 0};
            if (a->name == b->name) ctx.overload_variants = signatures_by_name[a->name].size() - 1;

            ConfidenceResult scored = calculator.score(edge.score, group.members.size(), ctx);
            edge.confidence = scored.final_score;
            edge.adjustments = scored.adjustments;
            confidence_sum += scored.final_score;
            all_scores.push_back(std::move(scored));
        }
        group.confidence = group.edges.empty() ? 0.0 : confidence_sum / static_cast<double>(group.edges.size());

        const double avg_complexity = complexity_sum / static_cast<double>(group.members.size());
        group.refactoring_impact = refactoring_impact(avg_complexity, combined_lines);
        group.priority = group.similarity * static_cast<double>(combined_lines);

        group.metadata["combined_lines"] = std::to_string(combined_lines);
        group.metadata["average_complexity"] = fixed4(avg_complexity);
        group.metadata["priority"] = fixed4(group.priority);
    }
    report.confidence = ConfidenceCalculator::summarize(all_scores);
    mark("confidence");

    // ---------------- rank ----------------
    check_cancel(cancel, "rank");
    std::sort(groups.begin(), groups.end(), [](const SimilarityGroup& a, const SimilarityGroup& b) {
        if (a.priority != b.priority) return a.priority > b.priority;
        if (a.similarity != b.similarity) return a.similarity > b.similarity;
        return a.members < b.members;
    });
    report.groups = std::move(groups);
    mark("rank");

    Logger::success("Found " + std::to_string(report.groups.size()) + " similarity groups across " +
                    std::to_string(report.representation_count) + " functions");
    return report;
}

} // namespace Twinscan
