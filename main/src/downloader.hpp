#pragma once

#include <chrono>
#include <string>

// Fetches `url` (http(s):// or file://) into memory.
// Throws RvmException(ErrorKind::Url) for unusable URLs and
// RvmException(ErrorKind::Network) for transfer failures or HTTP errors.
std::string fetch_to_string(const std::string& url, std::chrono::seconds timeout, bool show_progress = false);
