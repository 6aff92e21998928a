// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "system/Error.hxx"

#include <signal.h>
#include <sys/resource.h>

/**
 * Lower the soft RLIMIT_FSIZE for the lifetime of this object, so
 * writes beyond the limit are cut short.  SIGXFSZ is ignored
 * meanwhile; the previous limit and signal disposition are restored
 * by the destructor.
 */
class ScopeFileSizeLimit {
	struct rlimit old_limit;
	struct sigaction old_action;

public:
	explicit ScopeFileSizeLimit(rlim_t limit) {
		if (getrlimit(RLIMIT_FSIZE, &old_limit) < 0)
			throw MakeErrno("getrlimit() failed");

		struct sigaction sa{};
		sa.sa_handler = SIG_IGN;
		if (sigaction(SIGXFSZ, &sa, &old_action) < 0)
			throw MakeErrno("sigaction() failed");

		struct rlimit new_limit = old_limit;
		new_limit.rlim_cur = limit;
		if (setrlimit(RLIMIT_FSIZE, &new_limit) < 0) {
			const int e = errno;
			sigaction(SIGXFSZ, &old_action, nullptr);
			throw MakeErrno(e, "setrlimit() failed");
		}
	}

	~ScopeFileSizeLimit() noexcept {
		setrlimit(RLIMIT_FSIZE, &old_limit);
		sigaction(SIGXFSZ, &old_action, nullptr);
	}

	ScopeFileSizeLimit(const ScopeFileSizeLimit &) = delete;
	ScopeFileSizeLimit &operator=(const ScopeFileSizeLimit &) = delete;
};
