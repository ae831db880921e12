/******************************************************************************\
 * sftp_ingest.cpp - Fetch the files waiting in a remote folder into a local
 *  output directory, optionally extracting ZIP containers.
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include <getopt.h>
#include <stdio.h>
#include <stdlib.h>

#include <filesystem>
#include <iostream>
#include <string>

#include "sftp_ingest.hpp"

const struct option long_opts[] = {
            {"config",      required_argument,  0, 'c'},
            {"host",        required_argument,  0, 'H'},
            {"user",        required_argument,  0, 'u'},
            {"folder",      required_argument,  0, 'f'},
            {"match",       required_argument,  0, 'm'},
            {"glob",        required_argument,  0, 'g'},
            {"backup",      required_argument,  0, 'b'},
            {"delete",      no_argument,        0, 'd'},
            {"extract",     no_argument,        0, 'x'},
            {"output",      required_argument,  0, 'o'},
            {"max",         required_argument,  0, 'n'},
            {"help",        no_argument,        0, 'h'},
            {0, 0, 0, 0}
            };

static void
usage(char const* name)
{
    fprintf(stdout, "Usage: %s [OPTIONS]... -o DIR\n", name);
    fprintf(stdout, "Fetch files waiting in a remote SFTP folder into DIR.\n\n");

    fprintf(stdout, "\t-c, --config FILE   JSON configuration file\n");
    fprintf(stdout, "\t-H, --host HOST     remote host\n");
    fprintf(stdout, "\t-u, --user USER     remote user (default: current user)\n");
    fprintf(stdout, "\t-f, --folder DIR    remote folder (default: " INGEST_DEFAULT_FOLDER ")\n");
    fprintf(stdout, "\t-m, --match REGEX   fetch names matching REGEX\n");
    fprintf(stdout, "\t-g, --glob GLOB     fetch names matching shell pattern GLOB\n");
    fprintf(stdout, "\t-b, --backup DIR    move fetched remote files to DIR\n");
    fprintf(stdout, "\t-d, --delete        delete fetched remote files\n");
    fprintf(stdout, "\t-x, --extract       extract fetched ZIP files\n");
    fprintf(stdout, "\t-o, --output DIR    local output directory\n");
    fprintf(stdout, "\t-n, --max N         fetch at most N files\n");
    fprintf(stdout, "\t-h, --help          Display this text and exit\n\n");

    fprintf(stdout, "Environment: " INGEST_HOST_ENV_VAR ", " INGEST_USER_ENV_VAR ", "
        INGEST_FOLDER_ENV_VAR ", " INGEST_MATCH_ENV_VAR ", " INGEST_GLOB_ENV_VAR ", "
        INGEST_BACKUP_ENV_VAR ", " INGEST_DELETE_ENV_VAR ", " INGEST_TMPDIR_ENV_VAR "\n");
}

// copy file into outputDir at relativePath, print and return the new path
static auto
copyOut(ingest::MaterializedFile const& file, std::filesystem::path const& outputDir,
    std::string const& relativePath)
{
    auto const dest = outputDir / relativePath;
    auto ec = std::error_code{};

    std::filesystem::create_directories(dest.parent_path(), ec);
    if (ec) {
        throw ingest::LocalIOError{"Cannot create " + dest.parent_path().string() + ": " + ec.message()};
    }
    std::filesystem::copy_file(file.path(), dest, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        throw ingest::LocalIOError{"Cannot copy " + file.path() + " to " + dest.string() + ": " + ec.message()};
    }

    std::cout << dest.string() << std::endl;
    return dest;
}

int
main(int argc, char **argv)
{
    auto cliConfig = ingest::SourceConfig{};
    auto configPath = std::string{};
    auto outputDir = std::string{};
    auto extract = false;
    auto maxFiles = long{-1};

    { // parse options using getopt
        int opt_ind = 0;
        int c;

        // process longopts
        while ((c = getopt_long(argc, argv, "c:H:u:f:m:g:b:dxo:n:h", long_opts, &opt_ind)) != -1)
        {
            switch (c)
            {
                case 'c':
                    configPath = optarg;
                    break;
                case 'H':
                    cliConfig.host = std::string{optarg};
                    break;
                case 'u':
                    cliConfig.user = std::string{optarg};
                    break;
                case 'f':
                    cliConfig.folder = std::string{optarg};
                    break;
                case 'm':
                    cliConfig.match = std::string{optarg};
                    break;
                case 'g':
                    cliConfig.glob = std::string{optarg};
                    break;
                case 'b':
                    cliConfig.backup = std::string{optarg};
                    break;
                case 'd':
                    cliConfig.deleteRemote = true;
                    break;
                case 'x':
                    extract = true;
                    break;
                case 'o':
                    outputDir = optarg;
                    break;
                case 'n':
                {
                    char* end = nullptr;
                    maxFiles = ::strtol(optarg, &end, 10);
                    if ((end == optarg) || (*end != '\0') || (maxFiles < 0)) {
                        fprintf(stderr, "Invalid file count: %s\n", optarg);
                        usage(argv[0]);
                        return 2;
                    }
                    break;
                }
                case 'h':
                    usage(argv[0]);
                    return 0;

                default:
                    usage(argv[0]);
                    return 2;
            }
        }

        if (optind < argc) {
            fprintf(stderr, "Unexpected argument: %s\n", argv[optind]);
            usage(argv[0]);
            return 2;
        }
        if (outputDir.empty()) {
            fprintf(stderr, "Missing output directory.\n");
            usage(argv[0]);
            return 2;
        }
        if (cliConfig.match && cliConfig.glob) {
            fprintf(stderr, "Only one of --match and --glob may be given.\n");
            usage(argv[0]);
            return 2;
        }
    }

    try {
        // config file < environment < command line
        auto config = configPath.empty()
            ? ingest::SourceConfig{}
            : ingest::SourceConfig::fromJsonFile(configPath);
        config.applyEnvironment();
        config.merge(cliConfig);

        auto source = ingest::RemoteFileSource{};
        config.configure(source);

        auto const outputPath = std::filesystem::path{outputDir};
        for (long count = 0; (maxFiles < 0) || (count < maxFiles); count++) {
            auto file = source.next();
            if (!file) {
                break;
            }

            if (extract) {
                for (auto&& member : file->extract()) {
                    copyOut(member, outputPath, member.remoteName());
                }
            } else {
                copyOut(*file, outputPath, file->name());
            }
        }

    } catch (std::exception const& ex) {
        fprintf(stderr, "sftp_ingest: %s\n", ex.what());
        return 1;
    }

    return 0;
}
