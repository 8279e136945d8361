// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "io/FileOutputStream.hxx"
#include "system/Error.hxx"
#include "util/SpanCast.hxx"

#include <cstdlib>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

/**
 * A directory below /tmp which is deleted (together with all files
 * created through this object) by the destructor.
 */
class TemporaryDirectory {
	std::string path;

	std::vector<std::string> files, directories;

public:
	TemporaryDirectory() {
		char buffer[] = "/tmp/oggdur-test-XXXXXX";
		if (mkdtemp(buffer) == nullptr)
			throw MakeErrno("Failed to create temporary directory");

		path = buffer;
	}

	~TemporaryDirectory() noexcept {
		for (const auto &i : files)
			unlink(i.c_str());
		for (const auto &i : directories)
			rmdir(i.c_str());
		rmdir(path.c_str());
	}

	TemporaryDirectory(const TemporaryDirectory &) = delete;
	TemporaryDirectory &operator=(const TemporaryDirectory &) = delete;

	const std::string &GetPath() const noexcept {
		return path;
	}

	/**
	 * Return the path of a file inside this directory and delete
	 * it (if it exists) in the destructor.
	 */
	std::string Register(std::string_view name) {
		files.emplace_back(path + "/" + std::string{name});
		return files.back();
	}

	std::string CreateFile(std::string_view name,
			       std::span<const std::byte> contents) {
		auto file_path = Register(name);

		FileOutputStream file(file_path);
		file.Write(contents);
		file.Commit();

		return file_path;
	}

	std::string CreateFile(std::string_view name, std::string_view contents) {
		return CreateFile(name, AsBytes(contents));
	}

	/**
	 * Create an empty subdirectory.  It must be empty again when
	 * this object is destroyed.
	 */
	std::string CreateDirectory(std::string_view name) {
		auto dir_path = path + "/" + std::string{name};
		if (mkdir(dir_path.c_str(), 0700) < 0)
			throw MakeErrno("Failed to create directory");

		directories.emplace_back(dir_path);
		return dir_path;
	}

	std::string CreateSymlink(std::string_view name, const char *target) {
		auto link_path = Register(name);
		if (symlink(target, link_path.c_str()) < 0)
			throw MakeErrno("Failed to create symlink");

		return link_path;
	}
};
