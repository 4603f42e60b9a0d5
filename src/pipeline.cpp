#include "iconsolve/algo/pipeline.hpp"

#include <exception>
#include <sstream>

#include "iconsolve/core/logger.hpp"
#include "iconsolve/util/base64.hpp"

namespace iconsolve::algo {
using iconsolve::core::Logger;

std::string format_outcome(const Result<Icon>& outcome, OutputFormat fmt) {
    std::ostringstream os;
    if (fmt == OutputFormat::Xy) {
        if (outcome) {
            os << "x: " << outcome.value().center_x << ", y: " << outcome.value().center_y;
        } else {
            os << "error: " << outcome.error();
        }
        return os.str();
    }

    if (outcome) {
        const Icon& i = outcome.value();
        os << "{ position: " << i.position << ", start: " << i.start << ", end: " << i.end
           << ", center_x: " << i.center_x << ", center_y: " << i.center_y
           << ", success: true }";
    } else {
        os << "{ message: '" << outcome.error() << "', success: false }";
    }
    return os.str();
}

Result<Summary> Pipeline::run(const std::string& dir) {
    auto& log = Logger::instance();

    auto listing = io::list_directory(dir);
    if (!listing) {
        log.error(listing.error());
        return listing.forward_error<Summary>();
    }

    Summary sum;
    for (const io::Entry& e : listing.value()) {
        ++sum.entries;
        log.debug("processing " + e.path);
        try {
            auto bytes = reader_.read_all(e.path);
            if (!bytes) {
                ++sum.failed;
                log.error(e.name + ": " + bytes.error());
                continue;
            }

            auto outcome = solver_.solve(util::base64::encode(bytes.value()));
            if (outcome) {
                ++sum.solved;
            } else {
                ++sum.rejected;
            }
            out_ << format_outcome(outcome, fmt_) << "\n";
        } catch (const std::exception& ex) {
            ++sum.failed;
            log.error(e.name + ": " + ex.what());
        } catch (...) {
            // Solver 是外部注入的，可能抛出任意类型
            ++sum.failed;
            log.error(e.name + ": unknown error");
        }
    }

    log.info("processed " + std::to_string(sum.entries) + " entries, " +
             std::to_string(sum.solved) + " solved, " + std::to_string(sum.rejected) +
             " rejected, " + std::to_string(sum.failed) + " failed");
    return Result<Summary>::ok(sum);
}

}  // namespace iconsolve::algo
