#include "batch.h"
#include <iomanip>
#include <stdexcept>
#include <string>
#include <vector>
#include "image_loader.h"
#include "report.h"

BatchResult encode_directory(Session& session, const Options& options, std::ostream& out, std::ostream& log)
{
    BatchResult result;
    auto paths = find_image_files_recursively(options.input, options.image_format);

    out << "Found " << paths.size() << " images" << std::endl;

    for (const auto& path : paths) {
        try {
            std::vector<uint8_t> pixels = image_bytes(load_image(path));
            std::string encoded = session.encode(pixels);
            double bits_per_byte = static_cast<double>(encoded.size()) / pixels.size();

            out << path.string() << " " << pixels.size() << " bytes -> " << encoded.size()
                << " bits (" << std::fixed << std::setprecision(3) << bits_per_byte << " bits/byte)" << std::endl;

            if (options.print_table) print_code_table(session, log);
            if (options.verify) verify_round_trip(session.code_table(), pixels, encoded, log);
            result.encoded++;
        }
        catch (const std::runtime_error& e) {
            log << path.string() << ": " << e.what() << std::endl;
            result.failed++;
        }

        reset_or_destroy(session);
    }

    return result;
}
