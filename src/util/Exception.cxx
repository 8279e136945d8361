// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "Exception.hxx"
#include "CharUtil.hxx"
#include "StringStrip.hxx"

#include <utility>

/**
 * Append a message with surrounding whitespace removed and inner
 * whitespace runs (including line breaks) folded into one space, so
 * every exception chain fits on one log line.
 */
static void
AppendSanitized(std::string &dest, std::string_view src) noexcept
{
	bool pending_space = false;

	for (const char ch : Strip(src)) {
		if (IsWhitespaceOrNull(ch)) {
			pending_space = true;
		} else {
			if (pending_space)
				dest.push_back(' ');
			pending_space = false;
			dest.push_back(ch);
		}
	}
}

/**
 * Obtain the exception nested in the given one.
 *
 * @return the nested exception or nullptr if there is none
 */
static std::exception_ptr
GetNested(const std::exception &e) noexcept
{
	const auto *nested = dynamic_cast<const std::nested_exception *>(&e);
	return nested != nullptr
		? nested->nested_ptr()
		: nullptr;
}

std::string
GetFullMessage(const std::exception &e,
	       const char *fallback, const char *separator) noexcept
{
	std::string result;
	AppendSanitized(result, e.what());

	for (auto ep = GetNested(e); ep;) {
		result += separator;

		try {
			std::rethrow_exception(std::exchange(ep, nullptr));
		} catch (const std::exception &nested) {
			AppendSanitized(result, nested.what());
			ep = GetNested(nested);
		} catch (...) {
			result += fallback;
		}
	}

	return result;
}

std::string
GetFullMessage(std::exception_ptr ep,
	       const char *fallback, const char *separator) noexcept
{
	try {
		std::rethrow_exception(std::move(ep));
	} catch (const std::exception &e) {
		return GetFullMessage(e, fallback, separator);
	} catch (...) {
		return fallback;
	}
}
