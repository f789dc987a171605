#pragma once

namespace sciclaw {

// Python bootstrap executed by the sandbox worker process.
const char* python_worker_source();

} // namespace sciclaw
