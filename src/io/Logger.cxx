// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Logger.hxx"
#include "UniqueFileDescriptor.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>

#include <ctime>

#include <sys/uio.h>
#include <unistd.h>

using std::string_view_literals::operator""sv;

unsigned LoggerDetail::max_level = 1;

static UniqueFileDescriptor log_fd;

LoggerDetail::ParamWrapper<std::exception_ptr>::ParamWrapper(std::exception_ptr ep) noexcept
	:ParamWrapper<std::string>(GetFullMessage(std::move(ep))) {}

void
SetLogFile(UniqueFileDescriptor &&fd) noexcept
{
	log_fd = std::move(fd);
}

std::string_view
GetLogLevelName(unsigned level) noexcept
{
	switch (level) {
	case 0:
	case 1:
		return "error"sv;

	case 2:
		return "warning"sv;

	case 3:
		return "info"sv;

	default:
		return "debug"sv;
	}
}

static constexpr struct iovec
MakeIovec(std::string_view s) noexcept
{
	return {const_cast<char *>(s.data()), s.size()};
}

/**
 * Format the current local time as ISO 8601 (without time zone).
 */
static std::string_view
FormatTimestamp(std::span<char, 32> buffer) noexcept
{
	const std::time_t now = std::time(nullptr);
	struct tm tm;
	if (localtime_r(&now, &tm) == nullptr)
		return "-"sv;

	const std::size_t length = strftime(buffer.data(), buffer.size(),
					    "%Y-%m-%dT%H:%M:%S", &tm);
	return {buffer.data(), length};
}

void
LoggerDetail::WriteV(unsigned level, std::string_view domain,
		     std::span<const std::string_view> buffers) noexcept
{
	static constexpr std::size_t MAX_IOVEC = 64;
	struct iovec v[MAX_IOVEC];
	std::size_t n = 0;

	char timestamp_buffer[32];
	v[n++] = MakeIovec(FormatTimestamp(timestamp_buffer));
	v[n++] = MakeIovec(" "sv);
	v[n++] = MakeIovec(GetLogLevelName(level));
	v[n++] = MakeIovec(" "sv);

	if (!domain.empty()) {
		v[n++] = MakeIovec("["sv);
		v[n++] = MakeIovec(domain);
		v[n++] = MakeIovec("] "sv);
	}

	for (const auto i : buffers) {
		if (n >= MAX_IOVEC - 1)
			break;

		v[n++] = MakeIovec(i);
	}

	v[n++] = MakeIovec("\n"sv);

	const int fd = log_fd.IsDefined() ? log_fd.Get() : STDERR_FILENO;
	ssize_t nbytes = writev(fd, v, n);
	(void)nbytes;
}

void
LoggerDetail::Fmt(unsigned level, std::string_view domain,
		  fmt::string_view format_str, fmt::format_args args) noexcept
try {
	if (!CheckLevel(level))
		return;

	const auto msg = fmt::vformat(format_str, args);

	const std::string_view s[]{msg};
	WriteV(level, domain, s);
} catch (const std::exception &e) {
	const std::string_view s[]{"Failed to format log message: "sv, e.what()};
	WriteV(level, domain, s);
}
