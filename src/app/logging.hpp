#pragma once

#include <QString>

namespace blockmark::app {

// Installs a Qt message handler that appends `time level category message`
// lines to `path`. Returns false when the file cannot be opened; the default
// handler (stderr) stays in place then.
bool install_file_logging(const QString& path);

// Enables debug output for every blockmark.* category.
void enable_verbose_logging();

} // namespace blockmark::app
