// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <array>
#include <exception>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

#include <stdio.h>

class UniqueFileDescriptor;

/*
 * Log levels: 1 = error, 2 = warning, 3 = info, 4 and above = debug.
 * A message is only written if its level is not larger than the
 * configured maximum (see SetLogLevel()).
 */

namespace LoggerDetail {

template<typename T>
struct ParamWrapper;

template<>
struct ParamWrapper<std::string_view> {
	std::string_view value;

	constexpr explicit ParamWrapper(std::string_view _value) noexcept
		:value(_value) {}

	constexpr std::string_view GetValue() const noexcept {
		return value;
	}
};

template<>
struct ParamWrapper<const char *> : ParamWrapper<std::string_view> {
	using ParamWrapper<std::string_view>::ParamWrapper;
};

template<>
struct ParamWrapper<std::string> {
	std::string value;

	template<typename S>
	explicit ParamWrapper(S &&_value) noexcept
		:value(std::forward<S>(_value)) {}

	[[gnu::pure]]
	std::string_view GetValue() const noexcept {
		return value;
	}
};

template<>
struct ParamWrapper<std::exception_ptr> : ParamWrapper<std::string> {
	explicit ParamWrapper(std::exception_ptr ep) noexcept;
};

template<>
struct ParamWrapper<unsigned> {
	char data[16];
	size_t size;

	ParamWrapper(unsigned _value) noexcept
		:size(snprintf(data, sizeof(data), "%u", _value)) {}

	std::string_view GetValue() const noexcept {
		return {data, size};
	}
};

template<typename... Params>
class ParamArray {
	std::tuple<ParamWrapper<Params>...> wrappers;

public:
	static constexpr size_t count = sizeof...(Params);
	std::array<std::string_view, count> values;

	explicit ParamArray(Params... params) noexcept
		:wrappers(params...)
	{
		std::apply([this](const auto &...w){
			auto *i = values.data();
			((*i++ = w.GetValue()), ...);
		}, wrappers);
	}
};

extern unsigned max_level;

inline bool
CheckLevel(unsigned level) noexcept
{
	return level <= max_level;
}

void
WriteV(unsigned level, std::string_view domain,
       std::span<const std::string_view> buffers) noexcept;

template<typename... Params>
void
LogConcat(unsigned level, std::string_view domain, Params... _params) noexcept
{
	if (!CheckLevel(level))
		return;

	const ParamArray<Params...> params(_params...);
	WriteV(level, domain, params.values);
}

void
Fmt(unsigned level, std::string_view domain,
    fmt::string_view format_str, fmt::format_args args) noexcept;

} /* namespace LoggerDetail */

inline void
SetLogLevel(unsigned level) noexcept
{
	LoggerDetail::max_level = level;
}

inline bool
CheckLogLevel(unsigned level) noexcept
{
	return LoggerDetail::CheckLevel(level);
}

/**
 * Send all log messages to the given file instead of stderr.  Each
 * line is written with a single write() call, so the file should be
 * opened with O_APPEND.  Passing an undefined descriptor switches
 * back to stderr.
 */
void
SetLogFile(UniqueFileDescriptor &&fd) noexcept;

/**
 * Returns the human-readable name of a log level.
 */
[[gnu::const]]
std::string_view
GetLogLevelName(unsigned level) noexcept;

template<typename D, typename... Params>
void
LogConcat(unsigned level, D &&domain, Params... params) noexcept
{
	LoggerDetail::LogConcat(level, std::forward<D>(domain),
				std::forward<Params>(params)...);
}

template<typename S, typename... Args>
void
LogFmt(unsigned level, std::string_view domain,
       const S &format_str, Args&&... args) noexcept
{
	LoggerDetail::Fmt(level, domain, format_str,
			  fmt::make_format_args(args...));
}

template<typename Domain>
class BasicLogger : public Domain {
public:
	BasicLogger() = default;

	template<typename D>
	explicit BasicLogger(D &&_domain)
		:Domain(std::forward<D>(_domain)) {}

	static bool CheckLevel(unsigned level) noexcept {
		return LoggerDetail::CheckLevel(level);
	}

	template<typename... Params>
	void operator()(unsigned level, Params... params) const noexcept {
		LoggerDetail::LogConcat(level, GetDomain(),
					std::forward<Params>(params)...);
	}

	template<typename S, typename... Args>
	void Fmt(unsigned level,  const S &format_str,
		 Args&&... args) const noexcept {
		LoggerDetail::Fmt(level, GetDomain(), format_str,
				  fmt::make_format_args(args...));
	}

	std::string_view GetDomain() const noexcept {
		return Domain::GetDomain();
	}
};

/**
 * A logger domain which refers to a literal string.
 */
class LiteralLoggerDomain {
	std::string_view domain;

public:
	constexpr explicit LiteralLoggerDomain(std::string_view _domain={}) noexcept
		:domain(_domain) {}

	constexpr std::string_view GetDomain() const noexcept {
		return domain;
	}
};

/**
 * A logger which uses a literal string as its domain.
 */
class LLogger : public BasicLogger<LiteralLoggerDomain> {
public:
	LLogger() = default;

	template<typename D>
	explicit LLogger(D &&_domain) noexcept
		:BasicLogger(std::forward<D>(_domain)) {}
};
