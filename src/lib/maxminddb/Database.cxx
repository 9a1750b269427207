// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Database.hxx"
#include "Error.hxx"
#include "lib/fmt/SystemError.hxx"

#include <netdb.h>

namespace MaxMind {

namespace {

class GaiErrorCategory final : public std::error_category {
public:
	const char *name() const noexcept override {
		return "getaddrinfo";
	}

	std::string message(int condition) const override {
		return gai_strerror(condition);
	}
};

GaiErrorCategory gai_error_category;

} // anonymous namespace

Database::Database(const char *path)
{
	const int status = MMDB_open(path, MMDB_MODE_MMAP, &mmdb);
	if (status == MMDB_IO_ERROR)
		throw FmtErrno("Failed to open '{}'", path);

	if (status != MMDB_SUCCESS)
		throw FmtSystemError(std::error_code(status, error_category),
				     "Failed to open '{}'", path);
}

std::string_view
Database::LookupCountryCode(const char *address) const
{
	int gai_error, mmdb_error;
	auto result = MMDB_lookup_string(&mmdb, address,
					 &gai_error, &mmdb_error);
	if (gai_error != 0)
		throw std::system_error(gai_error, gai_error_category,
					"Malformed address");

	if (mmdb_error != MMDB_SUCCESS)
		throw MakeError(mmdb_error, "MaxMind lookup failed");

	if (!result.found_entry)
		return {};

	MMDB_entry_data_s entry_data;
	const int status = MMDB_get_value(&result.entry, &entry_data,
					  "country", "iso_code", nullptr);
	if (status == MMDB_LOOKUP_PATH_DOES_NOT_MATCH_DATA_ERROR)
		return {};

	if (status != MMDB_SUCCESS)
		throw MakeError(status, "Failed to read MaxMind record");

	if (!entry_data.has_data ||
	    entry_data.type != MMDB_DATA_TYPE_UTF8_STRING)
		return {};

	return {entry_data.utf8_string, entry_data.data_size};
}

} // namespace MaxMind
