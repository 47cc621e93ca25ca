#include "SaftFallbackParser.hpp"
#include "RecordResolver.hpp"
#include "SaftErrors.hpp"
#include "SaftLogging.hpp"
#include "SaftTags.hpp"
#include "XmlElement.hpp"

#include <exception>
#include <memory>
#include <vector>

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

namespace saft {

namespace {

constexpr const char *ROOT_SECTION = "(root)";

struct XmlDocDeleter {
	void operator()(xmlDoc *doc) const {
		xmlFreeDoc(doc);
	}
};

struct XmlCharDeleter {
	void operator()(xmlChar *p) const {
		xmlFree(p);
	}
};

using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;
using XmlCharPtr = std::unique_ptr<xmlChar, XmlCharDeleter>;

struct ReadContext {
	ByteSource &source;
	std::exception_ptr error;
};

int ReadCallback(void *context, char *buffer, int len) {
	auto *ctx = static_cast<ReadContext *>(context);
	try {
		return static_cast<int>(ctx->source.Read(buffer, static_cast<size_t>(len)));
	} catch (...) {
		ctx->error = std::current_exception();
		return -1;
	}
}

int CloseCallback(void *) {
	return 0;
}

bool IsElement(const xmlNode *node) {
	return node->type == XML_ELEMENT_NODE;
}

std::string NameOf(const xmlNode *node) {
	return LocalName(reinterpret_cast<const char *>(node->name));
}

std::string DirectText(const xmlNode *node) {
	std::string text;
	for (const xmlNode *child = node->children; child; child = child->next) {
		if ((child->type == XML_TEXT_NODE || child->type == XML_CDATA_SECTION_NODE) && child->content) {
			text += reinterpret_cast<const char *>(child->content);
		}
	}
	return text;
}

std::vector<std::pair<std::string, std::string>> AttributesOf(const xmlNode *node) {
	std::vector<std::pair<std::string, std::string>> attributes;
	for (const xmlAttr *attr = node->properties; attr; attr = attr->next) {
		XmlCharPtr value(xmlNodeListGetString(node->doc, attr->children, 1));
		attributes.emplace_back(LocalName(reinterpret_cast<const char *>(attr->name)),
		                        value ? reinterpret_cast<const char *>(value.get()) : "");
	}
	return attributes;
}

void CopyAttributes(const xmlNode *src, XmlElement &dst) {
	for (auto &attr : AttributesOf(src)) {
		dst.AddAttribute(std::move(attr.first), std::move(attr.second));
	}
}

// Copies the element children of src under dst. Transactions are not copied when
// deferred is set; they are handed back for separate processing instead.
void ConvertChildren(const xmlNode *src, XmlElement &dst, std::vector<const xmlNode *> *deferred) {
	for (const xmlNode *child = src->children; child; child = child->next) {
		if ((child->type == XML_TEXT_NODE || child->type == XML_CDATA_SECTION_NODE) && child->content) {
			dst.text += reinterpret_cast<const char *>(child->content);
			continue;
		}
		if (!IsElement(child)) {
			continue;
		}
		auto name = NameOf(child);
		if (deferred && name == tags::TRANSACTION) {
			deferred->push_back(child);
			continue;
		}
		auto &node = dst.AddChild(name);
		CopyAttributes(child, node);
		ConvertChildren(child, node, deferred);
	}
}

std::unique_ptr<XmlElement> Convert(const xmlNode *src, std::vector<const xmlNode *> *deferred = nullptr) {
	auto element = std::make_unique<XmlElement>(NameOf(src));
	CopyAttributes(src, *element);
	ConvertChildren(src, *element, deferred);
	return element;
}

class DocumentWalker {
public:
	DocumentWalker(RecordEmitter &emitter, const IngestOptions &options)
	    : emitter_(emitter), options_(options), resolver_(options.Aliases(), options.max_resolve_depth) {
	}

	void WalkRecords(const xmlNode *node, const std::string &parent_name, int gl_depth) {
		auto name = NameOf(node);
		if (name == tags::HEADER) {
			emitter_.EmitHeader(resolver_.ResolveHeader(*Convert(node)));
		} else if (IsAccountTag(name)) {
			auto account = resolver_.ResolveAccount(*Convert(node));
			if (account) {
				emitter_.EmitAccount(*account);
			}
		} else if (name == tags::TAX_TABLE_ENTRY) {
			for (const auto &entry : resolver_.ResolveTaxTableEntry(*Convert(node))) {
				emitter_.EmitTaxTableEntry(entry);
			}
		} else if (name == tags::CUSTOMER || name == tags::SUPPLIER) {
			auto kind = name == tags::CUSTOMER ? PartyKind::CUSTOMER : PartyKind::SUPPLIER;
			auto party = resolver_.ResolveParty(*Convert(node), kind);
			if (party) {
				emitter_.EmitParty(*party);
			}
		} else if (name == tags::JOURNAL) {
			WalkJournal(node);
		} else if (name == tags::TRANSACTION) {
			WalkTransaction(node);
		} else if (IsLineTag(name) && gl_depth > 0) {
			SkipOrphan(name);
		} else if (name == tags::INVOICE &&
		           (parent_name == tags::SALES_INVOICES || parent_name == tags::PURCHASE_INVOICES)) {
			auto kind = parent_name == tags::SALES_INVOICES ? PartyKind::CUSTOMER : PartyKind::SUPPLIER;
			emitter_.EmitInvoice(resolver_.ResolveInvoice(*Convert(node), kind));
		} else {
			int child_depth = gl_depth + (name == "GeneralLedgerEntries" ? 1 : 0);
			for (const xmlNode *child = node->children; child; child = child->next) {
				if (IsElement(child)) {
					WalkRecords(child, name, child_depth);
				}
			}
		}
	}

	// Post-order pass feeding the element census and the raw dump.
	void WalkElements(const xmlNode *node, const std::string &section, std::string &xpath) {
		auto name = NameOf(node);
		auto saved = xpath.size();
		xpath += "/" + name;
		const auto &child_section = IsStructuralTag(name) ? name : section;
		for (const xmlNode *child = node->children; child; child = child->next) {
			if (IsElement(child)) {
				WalkElements(child, child_section, xpath);
			}
		}
		emitter_.CountElement(name, section);
		if (options_.write_raw_elements) {
			emitter_.EmitRawElement(xpath, name, Trim(DirectText(node)), AttributesOf(node));
		}
		xpath.resize(saved);
		stats_.elements++;
	}

	const FallbackStats &Stats() const {
		return stats_;
	}

private:
	void SkipOrphan(const std::string &name) {
		stats_.orphan_lines++;
		Logger()->warn("Skipping {} outside a Transaction", name);
	}

	void WalkJournal(const xmlNode *node) {
		emitter_.OpenJournal();
		auto journal = std::make_unique<XmlElement>(NameOf(node));
		CopyAttributes(node, *journal);
		CollectJournal(node, *journal, *journal);
		emitter_.CloseJournal(resolver_.ResolveJournal(*journal));
	}

	// Journal children except transactions, which are walked as vouchers on the spot.
	void CollectJournal(const xmlNode *src, XmlElement &dst, const XmlElement &journal) {
		for (const xmlNode *child = src->children; child; child = child->next) {
			if ((child->type == XML_TEXT_NODE || child->type == XML_CDATA_SECTION_NODE) && child->content) {
				dst.text += reinterpret_cast<const char *>(child->content);
				continue;
			}
			if (!IsElement(child)) {
				continue;
			}
			auto name = NameOf(child);
			if (name == tags::TRANSACTION) {
				emitter_.SetJournalContext(resolver_.ResolveJournal(journal));
				WalkTransaction(child);
			} else if (IsLineTag(name)) {
				SkipOrphan(name);
			} else {
				auto &node = dst.AddChild(name);
				CopyAttributes(child, node);
				CollectJournal(child, node, journal);
			}
		}
	}

	void WalkTransaction(const xmlNode *node) {
		std::vector<const xmlNode *> nested;
		emitter_.OpenVoucher();
		auto transaction = std::make_unique<XmlElement>(NameOf(node));
		CopyAttributes(node, *transaction);
		bool context_set = false;
		CollectTransaction(node, *transaction, *transaction, context_set, nested);
		emitter_.CloseVoucher(resolver_.ResolveVoucher(*transaction));

		for (const auto *inner : nested) {
			stats_.nested_vouchers++;
			Logger()->warn("Transaction nested inside another Transaction, emitted as its own voucher");
			WalkTransaction(inner);
		}
	}

	// Transaction children except lines, which are emitted on the spot.
	void CollectTransaction(const xmlNode *src, XmlElement &dst, const XmlElement &transaction, bool &context_set,
	                        std::vector<const xmlNode *> &nested) {
		for (const xmlNode *child = src->children; child; child = child->next) {
			if ((child->type == XML_TEXT_NODE || child->type == XML_CDATA_SECTION_NODE) && child->content) {
				dst.text += reinterpret_cast<const char *>(child->content);
				continue;
			}
			if (!IsElement(child)) {
				continue;
			}
			auto name = NameOf(child);
			if (name == tags::TRANSACTION) {
				nested.push_back(child);
			} else if (IsLineTag(name)) {
				if (!context_set) {
					emitter_.SetVoucherContext(resolver_.ResolveVoucher(transaction));
					context_set = true;
				}
				auto line = Convert(child, &nested);
				auto record_id = resolver_.Fields().Resolve(*line, "RecordID").value_or("");
				emitter_.EmitLine(resolver_.ResolveLine(*line), resolver_.ResolveAnalyses(*line, record_id));
			} else {
				auto &node = dst.AddChild(name);
				CopyAttributes(child, node);
				CollectTransaction(child, node, transaction, context_set, nested);
			}
		}
	}

	RecordEmitter &emitter_;
	const IngestOptions &options_;
	RecordResolver resolver_;
	FallbackStats stats_;
};

} // namespace

SaftFallbackParser::SaftFallbackParser(ByteSource &source, RecordEmitter &emitter, const IngestOptions &options)
    : source_(source), emitter_(emitter), options_(options) {
}

FallbackStats SaftFallbackParser::Run() {
	ReadContext read_ctx {source_, nullptr};
	xmlResetLastError();
	XmlDocPtr doc(xmlReadIO(ReadCallback, CloseCallback, &read_ctx, source_.Name().c_str(), nullptr,
	                        XML_PARSE_RECOVER | XML_PARSE_HUGE | XML_PARSE_NONET | XML_PARSE_NOERROR |
	                            XML_PARSE_NOWARNING));
	if (read_ctx.error) {
		try {
			std::rethrow_exception(read_ctx.error);
		} catch (const SourceFormatError &) {
			throw;
		} catch (const std::exception &e) {
			throw FallbackParsingError("SaftFallbackParser: read failed for " + source_.Name() + ": " + e.what());
		}
	}
	const xmlError *last = xmlGetLastError();
	if (!doc) {
		std::string detail = last && last->message ? Trim(last->message) : "no document";
		throw FallbackParsingError("SaftFallbackParser: cannot parse " + source_.Name() + ": " + detail);
	}
	if (last && last->message) {
		Logger()->warn("Recovered from XML error in {} at line {}: {}", source_.Name(), last->line,
		               Trim(last->message));
	}
	const xmlNode *root = xmlDocGetRootElement(doc.get());
	if (!root) {
		throw FallbackParsingError("SaftFallbackParser: empty document " + source_.Name());
	}

	DocumentWalker walker(emitter_, options_);
	try {
		walker.WalkRecords(root, "", 0);
		std::string xpath;
		walker.WalkElements(root, ROOT_SECTION, xpath);
		emitter_.Flush();
	} catch (const FallbackParsingError &) {
		throw;
	} catch (const std::exception &e) {
		throw FallbackParsingError("SaftFallbackParser: " + std::string(e.what()));
	}
	return walker.Stats();
}

} // namespace saft
