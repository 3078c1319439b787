#pragma once

#include <string>

// MIME type for a file name, looked up by extension.
std::string get_content_type(const std::string& file);
