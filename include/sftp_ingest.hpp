/******************************************************************************\
 * sftp_ingest.hpp - Public interface of the sftp_ingest library.
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include "ingest_defs.h"

#include "transfer/IngestError.hpp"
#include "transfer/TempDirectory.hpp"
#include "transfer/MaterializedFile.hpp"
#include "transfer/Extractable.hpp"
#include "transfer/ZipArchive.hpp"
#include "transfer/NamePattern.hpp"
#include "transfer/RemoteSession.hpp"
#include "transfer/RemoteFileSource.hpp"
#include "config/SourceConfig.hpp"
