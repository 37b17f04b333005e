/**
 * @file    main.cpp
 * @brief   NexusConverter - CLI Entry Point
 * @license MIT
 *
 * @details
 * HTTP conversion gateway (images, video, documents, remote media) with a
 * product image composition engine at its core.
 *
 * Usage:
 *   nexus_converter serve --port 3000
 *   nexus_converter compose -s product.jpg -w logo.png -o sheet.jpg
 *   nexus_converter compose -s product.jpg -w mark.png -o out.png --layout overlay --mode center
 */

#include "cli/cli_app.hpp"

int main(int argc, char** argv) {
    return nxc::cli::run(argc, argv);
}
