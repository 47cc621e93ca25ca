#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace saft {

struct ProgressSnapshot {
	double elapsed_seconds = 0.0;
	uint64_t events = 0;
	double events_per_second = 0.0;
	// entity name -> rows written so far
	std::map<std::string, uint64_t> rows;
	// phase name -> cumulative seconds, slowest first, at most TOP_PHASES entries
	std::vector<std::pair<std::string, double>> slowest_phases;

	static constexpr size_t TOP_PHASES = 6;
};

// Receives periodic snapshots from the streaming parser. Returning false requests a
// stop; the run then ends at this tick with every table flushed.
class ProgressListener {
public:
	virtual ~ProgressListener() = default;
	virtual bool OnProgress(const ProgressSnapshot &snapshot) = 0;
};

// Stop flag of one run. Set by a listener returning false, or directly by a host;
// the parser only looks at it at tick boundaries.
class CancellationToken {
public:
	void Cancel() {
		cancelled_.store(true, std::memory_order_relaxed);
	}
	[[nodiscard]] bool IsCancelled() const {
		return cancelled_.load(std::memory_order_relaxed);
	}

private:
	std::atomic<bool> cancelled_ {false};
};

// Stops a run at the next tick once an external flag is raised, such as a host's query
// interrupt flag. The flag must outlive the run.
class InterruptFlagListener : public ProgressListener {
public:
	explicit InterruptFlagListener(const std::atomic<bool> &interrupted) : interrupted_(interrupted) {
	}

	bool OnProgress(const ProgressSnapshot &) override {
		return !interrupted_.load(std::memory_order_relaxed);
	}

private:
	const std::atomic<bool> &interrupted_;
};

// Timed handler phases of the streaming parser.
enum class Phase : uint8_t {
	START_ELEMENT,
	END_ELEMENT,
	CENSUS,
	RAW,
	HEADER,
	ACCOUNT,
	TAX_TABLE,
	PARTY,
	INVOICE,
	LINE,
	VOUCHER,
	JOURNAL,
	PHASE_COUNT
};

const char *PhaseName(Phase phase);

// Cumulative wall time and call count per handler phase.
class PhaseStats {
public:
	void Record(Phase phase, double seconds) {
		auto &entry = phases_[static_cast<size_t>(phase)];
		entry.seconds += seconds;
		entry.count++;
	}

	[[nodiscard]] double Seconds(Phase phase) const {
		return phases_[static_cast<size_t>(phase)].seconds;
	}
	[[nodiscard]] uint64_t Count(Phase phase) const {
		return phases_[static_cast<size_t>(phase)].count;
	}
	// Phases that ran at least once, slowest first.
	[[nodiscard]] std::vector<std::pair<std::string, double>> Slowest(size_t n) const;

private:
	struct Entry {
		double seconds = 0.0;
		uint64_t count = 0;
	};
	std::array<Entry, static_cast<size_t>(Phase::PHASE_COUNT)> phases_ {};
};

class ScopedPhaseTimer {
public:
	ScopedPhaseTimer(PhaseStats &stats, Phase phase)
	    : stats_(stats), phase_(phase), start_(std::chrono::steady_clock::now()) {
	}
	~ScopedPhaseTimer() {
		std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_;
		stats_.Record(phase_, elapsed.count());
	}

	ScopedPhaseTimer(const ScopedPhaseTimer &) = delete;
	ScopedPhaseTimer &operator=(const ScopedPhaseTimer &) = delete;

private:
	PhaseStats &stats_;
	Phase phase_;
	std::chrono::steady_clock::time_point start_;
};

} // namespace saft
