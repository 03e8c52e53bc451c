#pragma once

namespace scrubby::logging
{

    /** Install the process-wide stderr logger; warn by default, debug when verbose */
    void init(bool verbose);

} // namespace scrubby::logging
