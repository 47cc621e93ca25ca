#include "SaftStreamReader.hpp"
#include "RecordResolver.hpp"
#include "SaftErrors.hpp"
#include "SaftLogging.hpp"
#include "SaftTags.hpp"
#include "XmlElement.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <vector>

#include <expat.h>

namespace saft {

namespace {

enum class ParseContext {
	IDLE,
	SECTION,
	HEADER,
	ACCOUNT,
	TAX_TABLE,
	PARTY,
	JOURNAL,
	VOUCHER,
	LINE,
	ANALYSIS,
	INVOICE,
};

constexpr const char *ROOT_SECTION = "(root)";

} // namespace

const char *StreamingStatusName(StreamingAttempt::Status status) {
	switch (status) {
	case StreamingAttempt::Status::COMPLETED:
		return "completed";
	case StreamingAttempt::Status::CANCELLED:
		return "cancelled";
	case StreamingAttempt::Status::FAILED:
	default:
		return "failed";
	}
}

struct SaftStreamReader::Impl {
	// One open element.
	struct Frame {
		std::string name;
		ParseContext context = ParseContext::IDLE;
		// Nearest structural ancestor, the census bucket of this element.
		std::string section;
		// Captured node receiving this element's text and children, or nullptr.
		XmlElement *node = nullptr;
		// Set on capture roots; released when the element closes.
		std::unique_ptr<XmlElement> owned;
		PartyKind kind = PartyKind::CUSTOMER;
		// GeneralLedgerEntries, Journal or Transaction frame counted in gl_depth.
		bool general_ledger = false;
		// Only filled for the raw dump.
		std::string raw_text;
		std::vector<std::pair<std::string, std::string>> raw_attributes;
	};

	ByteSource &source;
	RecordEmitter &emitter;
	const IngestOptions &options;
	ProgressListener *listener;
	CancellationToken &token;
	RecordResolver resolver;

	XML_Parser parser = nullptr;
	std::vector<Frame> frames;
	// Capture roots of the open journal and voucher, owned by their frames.
	XmlElement *journal_node = nullptr;
	XmlElement *voucher_node = nullptr;
	bool voucher_context_set = false;
	// Open GeneralLedgerEntries, Journal and Transaction elements.
	int gl_depth = 0;

	uint64_t events = 0;
	// Captured nodes alive right now, and the most ever alive at once.
	uint64_t retained_nodes = 0;
	uint64_t peak_retained_nodes = 0;
	size_t peak_depth = 0;
	bool cancelled = false;
	PhaseStats phases;
	std::chrono::steady_clock::time_point started;

	// Exception captured from a SAX callback (expat is C, nothing may unwind through it)
	std::exception_ptr pending_exception;

	Impl(ByteSource &source_p, RecordEmitter &emitter_p, const IngestOptions &options_p,
	     ProgressListener *listener_p, CancellationToken &token_p)
	    : source(source_p), emitter(emitter_p), options(options_p), listener(listener_p), token(token_p),
	      resolver(options_p.Aliases(), options_p.max_resolve_depth) {
		parser = XML_ParserCreateNS(nullptr, '|');
		if (!parser) {
			throw StreamingTraversalError("SaftStreamReader: failed to create XML parser");
		}
		XML_SetUserData(parser, this);
		XML_SetElementHandler(parser, start_element_handler, end_element_handler);
		XML_SetCharacterDataHandler(parser, char_data_handler);
	}

	~Impl() {
		if (parser) {
			XML_ParserFree(parser);
		}
	}

	void check_pending_exception() {
		if (pending_exception) {
			std::rethrow_exception(pending_exception);
		}
	}

	void parse() {
		started = std::chrono::steady_clock::now();
		std::vector<char> buffer(READ_CHUNK);
		while (true) {
			size_t bytes_read = source.Read(buffer.data(), buffer.size());
			bool is_final = (bytes_read == 0);

			auto status = XML_Parse(parser, buffer.data(), static_cast<int>(bytes_read), is_final);

			check_pending_exception();
			if (cancelled) {
				return;
			}
			if (status == XML_STATUS_ERROR) {
				auto line = XML_GetCurrentLineNumber(parser);
				auto err = XML_ErrorString(XML_GetErrorCode(parser));
				throw StreamingTraversalError("SaftStreamReader: XML parse error at line " + std::to_string(line) +
				                              " in " + source.Name() + ": " + std::string(err));
			}
			if (is_final) {
				return;
			}
		}
	}

	static void XMLCALL start_element_handler(void *user_data, const char *name, const char **attrs) {
		auto *self = static_cast<Impl *>(user_data);
		if (self->pending_exception) {
			return;
		}
		try {
			self->on_start_element(LocalName(name), attrs);
		} catch (...) {
			self->pending_exception = std::current_exception();
			XML_StopParser(self->parser, XML_FALSE);
		}
	}

	static void XMLCALL end_element_handler(void *user_data, const char *name) {
		auto *self = static_cast<Impl *>(user_data);
		if (self->pending_exception || self->cancelled) {
			return;
		}
		try {
			self->on_end_element();
		} catch (...) {
			self->pending_exception = std::current_exception();
			XML_StopParser(self->parser, XML_FALSE);
		}
	}

	static void XMLCALL char_data_handler(void *user_data, const char *s, int len) {
		auto *self = static_cast<Impl *>(user_data);
		if (self->pending_exception || self->frames.empty()) {
			return;
		}
		auto &top = self->frames.back();
		if (top.node) {
			top.node->text.append(s, static_cast<size_t>(len));
		}
		if (self->options.write_raw_elements) {
			top.raw_text.append(s, static_cast<size_t>(len));
		}
	}

	void retain() {
		if (++retained_nodes > peak_retained_nodes) {
			peak_retained_nodes = retained_nodes;
		}
	}

	// Start a capture root owned by frame.
	void capture(Frame &frame) {
		frame.owned = std::make_unique<XmlElement>(frame.name);
		frame.node = frame.owned.get();
		retain();
	}

	void open_voucher(Frame &frame) {
		capture(frame);
		frame.context = ParseContext::VOUCHER;
		if (journal_node) {
			emitter.SetJournalContext(resolver.ResolveJournal(*journal_node));
		}
		emitter.OpenVoucher();
		voucher_node = frame.node;
		voucher_context_set = false;
		frame.general_ledger = true;
	}

	void open_line(Frame &frame) {
		if (!voucher_context_set) {
			emitter.SetVoucherContext(resolver.ResolveVoucher(*voucher_node));
			voucher_context_set = true;
		}
		capture(frame);
		frame.context = ParseContext::LINE;
	}

	void on_start_element(const char *local, const char **attrs) {
		ScopedPhaseTimer timer(phases, Phase::START_ELEMENT);
		if (frames.size() >= MAX_DEPTH) {
			throw StreamingTraversalError("SaftStreamReader: XML nesting too deep (>" + std::to_string(MAX_DEPTH) +
			                              " levels) in " + source.Name());
		}

		Frame frame;
		frame.name = local;
		const Frame *parent = frames.empty() ? nullptr : &frames.back();
		if (parent) {
			frame.section = IsStructuralTag(parent->name) ? parent->name : parent->section;
		} else {
			frame.section = ROOT_SECTION;
		}
		auto ctx = parent ? parent->context : ParseContext::IDLE;
		const auto &name = frame.name;
		if (IsSectionTag(name)) {
			Logger()->debug("Entering {} after {} events", name, events);
		}

		if (name == tags::TRANSACTION && voucher_node) {
			throw StreamingTraversalError("SaftStreamReader: Transaction opened inside another Transaction in " +
			                              source.Name());
		}

		if (parent && parent->node) {
			// inside a captured record
			if (ctx == ParseContext::VOUCHER && IsLineTag(name)) {
				open_line(frame);
			} else if (ctx == ParseContext::JOURNAL && name == tags::TRANSACTION) {
				open_voucher(frame);
			} else if (ctx == ParseContext::JOURNAL && IsLineTag(name)) {
				throw StreamingTraversalError("SaftStreamReader: " + name + " outside a Transaction in " +
				                              source.Name());
			} else {
				frame.node = &parent->node->AddChild(name);
				retain();
				frame.context = (ctx == ParseContext::LINE && name == tags::ANALYSIS) ? ParseContext::ANALYSIS : ctx;
			}
		} else if (name == tags::HEADER) {
			capture(frame);
			frame.context = ParseContext::HEADER;
		} else if (IsAccountTag(name)) {
			capture(frame);
			frame.context = ParseContext::ACCOUNT;
		} else if (name == tags::TAX_TABLE_ENTRY) {
			capture(frame);
			frame.context = ParseContext::TAX_TABLE;
		} else if (name == tags::CUSTOMER || name == tags::SUPPLIER) {
			capture(frame);
			frame.context = ParseContext::PARTY;
			frame.kind = name == tags::CUSTOMER ? PartyKind::CUSTOMER : PartyKind::SUPPLIER;
		} else if (name == tags::JOURNAL) {
			capture(frame);
			frame.context = ParseContext::JOURNAL;
			journal_node = frame.node;
			emitter.OpenJournal();
			frame.general_ledger = true;
		} else if (name == tags::TRANSACTION) {
			open_voucher(frame);
		} else if (IsLineTag(name) && gl_depth > 0) {
			throw StreamingTraversalError("SaftStreamReader: " + name + " outside a Transaction in " + source.Name());
		} else if (name == tags::INVOICE && parent &&
		           (parent->name == tags::SALES_INVOICES || parent->name == tags::PURCHASE_INVOICES)) {
			capture(frame);
			frame.context = ParseContext::INVOICE;
			frame.kind = parent->name == tags::SALES_INVOICES ? PartyKind::CUSTOMER : PartyKind::SUPPLIER;
		} else if (IsSectionTag(name)) {
			frame.context = ParseContext::SECTION;
			frame.general_ledger = name == "GeneralLedgerEntries";
		} else {
			frame.context = ctx;
		}
		if (frame.general_ledger) {
			gl_depth++;
		}

		bool keep_attributes = frame.node != nullptr;
		for (size_t i = 0; attrs[i]; i += 2) {
			const char *attr_name = LocalName(attrs[i]);
			if (keep_attributes) {
				frame.node->AddAttribute(attr_name, attrs[i + 1]);
			}
			if (options.write_raw_elements) {
				frame.raw_attributes.emplace_back(attr_name, attrs[i + 1]);
			}
		}
		frames.push_back(std::move(frame));
		peak_depth = std::max(peak_depth, frames.size());
	}

	void on_end_element() {
		ScopedPhaseTimer timer(phases, Phase::END_ELEMENT);
		auto &frame = frames.back();

		if (frame.owned) {
			dispatch_record(frame);
			retained_nodes -= frame.owned->NodeCount();
		}
		if (frame.general_ledger) {
			gl_depth--;
		}

		{
			ScopedPhaseTimer census(phases, Phase::CENSUS);
			emitter.CountElement(frame.name, frame.section);
		}
		if (options.write_raw_elements) {
			ScopedPhaseTimer raw(phases, Phase::RAW);
			emitter.EmitRawElement(current_xpath(), frame.name, Trim(frame.raw_text), frame.raw_attributes);
		}

		// releases a captured subtree owned by this frame
		frames.pop_back();

		events++;
		if (options.progress_interval > 0 && events % options.progress_interval == 0) {
			tick();
		}
	}

	void dispatch_record(Frame &frame) {
		const auto &node = *frame.node;
		switch (frame.context) {
		case ParseContext::HEADER: {
			ScopedPhaseTimer timer(phases, Phase::HEADER);
			emitter.EmitHeader(resolver.ResolveHeader(node));
			break;
		}
		case ParseContext::ACCOUNT: {
			ScopedPhaseTimer timer(phases, Phase::ACCOUNT);
			auto account = resolver.ResolveAccount(node);
			if (account) {
				emitter.EmitAccount(*account);
			}
			break;
		}
		case ParseContext::TAX_TABLE: {
			ScopedPhaseTimer timer(phases, Phase::TAX_TABLE);
			for (const auto &entry : resolver.ResolveTaxTableEntry(node)) {
				emitter.EmitTaxTableEntry(entry);
			}
			break;
		}
		case ParseContext::PARTY: {
			ScopedPhaseTimer timer(phases, Phase::PARTY);
			auto party = resolver.ResolveParty(node, frame.kind);
			if (party) {
				emitter.EmitParty(*party);
			}
			break;
		}
		case ParseContext::INVOICE: {
			ScopedPhaseTimer timer(phases, Phase::INVOICE);
			emitter.EmitInvoice(resolver.ResolveInvoice(node, frame.kind));
			break;
		}
		case ParseContext::LINE: {
			ScopedPhaseTimer timer(phases, Phase::LINE);
			auto line = resolver.ResolveLine(node);
			auto record_id = resolver.Fields().Resolve(node, "RecordID").value_or("");
			emitter.EmitLine(line, resolver.ResolveAnalyses(node, record_id));
			break;
		}
		case ParseContext::VOUCHER: {
			ScopedPhaseTimer timer(phases, Phase::VOUCHER);
			emitter.CloseVoucher(resolver.ResolveVoucher(node));
			voucher_node = nullptr;
			break;
		}
		case ParseContext::JOURNAL: {
			ScopedPhaseTimer timer(phases, Phase::JOURNAL);
			emitter.CloseJournal(resolver.ResolveJournal(node));
			journal_node = nullptr;
			break;
		}
		default:
			break;
		}
	}

	std::string current_xpath() const {
		std::string path;
		for (const auto &frame : frames) {
			path += "/";
			path += frame.name;
		}
		return path;
	}

	ProgressSnapshot snapshot() const {
		ProgressSnapshot snap;
		std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
		snap.elapsed_seconds = elapsed.count();
		snap.events = events;
		snap.events_per_second = snap.elapsed_seconds > 0 ? static_cast<double>(events) / snap.elapsed_seconds : 0.0;
		snap.rows = emitter.RowCounts();
		snap.slowest_phases = phases.Slowest(ProgressSnapshot::TOP_PHASES);
		return snap;
	}

	void tick() {
		emitter.Flush();
		if (listener && !listener->OnProgress(snapshot())) {
			token.Cancel();
		}
		if (token.IsCancelled()) {
			Logger()->info("Cancellation requested after {} events in {}", events, source.Name());
			cancelled = true;
			XML_StopParser(parser, XML_FALSE);
		}
	}
};

SaftStreamReader::SaftStreamReader(ByteSource &source, RecordEmitter &emitter, const IngestOptions &options,
                                   ProgressListener *listener, CancellationToken &token)
    : impl_(std::make_unique<Impl>(source, emitter, options, listener, token)) {
}

SaftStreamReader::~SaftStreamReader() = default;

const PhaseStats &SaftStreamReader::Phases() const {
	return impl_->phases;
}

StreamingAttempt SaftStreamReader::Run() {
	StreamingAttempt attempt;
	try {
		impl_->parse();
		if (impl_->cancelled) {
			impl_->emitter.Flush();
			attempt.status = StreamingAttempt::Status::CANCELLED;
		} else if (!impl_->frames.empty()) {
			throw StreamingTraversalError("SaftStreamReader: document ended with open elements in " +
			                              impl_->source.Name());
		} else {
			attempt.status = StreamingAttempt::Status::COMPLETED;
		}
	} catch (const SourceFormatError &) {
		throw;
	} catch (const std::exception &e) {
		attempt.status = StreamingAttempt::Status::FAILED;
		attempt.error = e.what();
	}
	attempt.events = impl_->events;
	attempt.peak_retained_nodes = impl_->peak_retained_nodes;
	attempt.peak_depth = impl_->peak_depth;
	return attempt;
}

} // namespace saft
