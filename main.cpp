#include "app/CliArguments.hpp"
#include "app/FileExtractorApp.hpp"
#include <utility>

int main(int argc, char** argv) {
    int exitCode = 0;
    auto options = fileextractor::app::ParseArguments(argc, argv, exitCode);
    if (!options) {
        return exitCode;
    }

    fileextractor::app::FileExtractorApp app(std::move(*options));
    return app.Run();
}
