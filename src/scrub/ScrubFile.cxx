// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ScrubFile.hxx"
#include "Engine.hxx"
#include "io/FileWriter.hxx"
#include "io/StringFile.hxx"
#include "lib/fmt/SystemError.hxx"
#include "util/UTF8.hxx"

#include <string>

#include <sys/stat.h>

namespace Scrub {

void
ScrubFile(const char *path, const RedactionEngine &engine,
	  RedactionStats &stats)
{
	struct stat st;
	std::string text = LoadStringFile(path, st);
	const mode_t mode = st.st_mode & 07777;

	if (!ValidateUTF8(text))
		text = SanitizeUTF8(text);

	const auto result = engine.Transform(text, stats);

	FileWriter writer(path, mode);

	/* the umask may have removed some of the bits */
	if (fchmod(writer.GetFileDescriptor().Get(), mode) < 0)
		throw FmtErrno("Failed to change the mode of '{}'",
			       writer.GetTemporaryPath());

	writer.Allocate(result.size());
	writer.Write(result);
	writer.Commit();
}

} // namespace Scrub
