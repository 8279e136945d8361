// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "Reader.hxx"

std::size_t
Reader::ReadAll(std::span<std::byte> dest)
{
	std::size_t position = 0;

	while (position < dest.size()) {
		const std::size_t nbytes = Read(dest.subspan(position));
		if (nbytes == 0)
			break;

		position += nbytes;
	}

	return position;
}
