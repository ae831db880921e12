/******************************************************************************\
 * IngestError.hpp - Exception types raised by the ingest engine. Every fatal
 *                   condition is reported by throwing one of these; warnings
 *                   are delivered through RemoteFileSource::WarningHandler.
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <stdexcept>
#include <string>

namespace ingest {

// common base so callers can handle every fatal engine error in one place
class Error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// missing host or file name, malformed configuration value
class ConfigurationError : public Error
{
public:
    using Error::Error;
};

// session open, handshake, host key or authentication failure
class ConnectionError : public Error
{
public:
    using Error::Error;
};

// remote list, working directory, get, make path or rename failure
class TransferError : public Error
{
public:
    using Error::Error;
};

// temporary directory creation, local write or readability failure
class LocalIOError : public Error
{
public:
    using Error::Error;
};

// container open / parse failure, member extraction failure
class ArchiveError : public Error
{
public:
    using Error::Error;
};

} /* namespace ingest */
