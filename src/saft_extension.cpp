#define DUCKDB_EXTENSION_MAIN

#include "saft_extension.hpp"
#include <SaftLogging.hpp>
#include <ingest_saft.hpp>
#include <saft_macros.hpp>

namespace duckdb {

static void SetDependencyLogging() {
	// record-level warnings stay off the console inside a database session
	saft::SetLogLevel("error");
}

static void LoadInternal(ExtensionLoader &loader) {
	SetDependencyLogging();
	IngestSaftTableFunction::Register(loader);
	SaftMacros::Register(loader);
}

void SaftExtension::Load(ExtensionLoader &loader) {
	LoadInternal(loader);
}

std::string SaftExtension::Name() {
	return "saft";
}

std::string SaftExtension::Version() const {
#ifdef EXT_VERSION_SAFT
	return EXT_VERSION_SAFT;
#else
	return "unversioned";
#endif
}

} // namespace duckdb

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(saft, loader) {
	duckdb::LoadInternal(loader);
}
}
