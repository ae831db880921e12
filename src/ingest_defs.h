/******************************************************************************\
 * ingest_defs.h - A header file for common compile time defines.
 *
 * NOTE: These defines are used throughout the internal code base and are all
 *       located here so they can be changed in one place.
 *
 * Copyright 2011-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#ifndef _INGEST_DEFS_H
#define _INGEST_DEFS_H

/*******************************************************************************
** Generic defines
*******************************************************************************/
#define INGEST_BUF_SIZE             32768
#define INGEST_LIBSSH2_RETRIES      10                      // attempts before giving up on LIBSSH2_ERROR_TIMEOUT
#define INGEST_TEMPDIR_PREFIX       "sftp_ingest-"          // prefix of every temporary workspace directory
#define INGEST_LOG_NAME             "sftp_ingest"           // base name of the debug log file

/*******************************************************************************
** Policy defaults for a remote file source
*******************************************************************************/
#define INGEST_DEFAULT_FOLDER       "/incoming"
#define INGEST_DEFAULT_SSH_PORT     "22"
#define INGEST_SELF_PARENT_REGEX    "^\\.{1,2}$"            // excludes the "." and ".." pseudo-entries

/*******************************************************************************
** Environment variables
*******************************************************************************/
#define INGEST_DBG_ENV_VAR              "INGEST_DEBUG"          // Set to enable the debug log
#define INGEST_LOG_DIR_ENV_VAR          "INGEST_LOG_DIR"        // Directory for the debug log (default is temp root)
#define INGEST_TMPDIR_ENV_VAR           "INGEST_TMPDIR"         // Root for temporary workspaces (checked before $TMPDIR)

#define INGEST_HOST_ENV_VAR             "INGEST_HOST"
#define INGEST_USER_ENV_VAR             "INGEST_USER"
#define INGEST_FOLDER_ENV_VAR           "INGEST_FOLDER"
#define INGEST_MATCH_ENV_VAR            "INGEST_MATCH"          // regular expression over bare file names
#define INGEST_GLOB_ENV_VAR             "INGEST_GLOB"           // shell glob over bare file names
#define INGEST_BACKUP_ENV_VAR           "INGEST_BACKUP"
#define INGEST_DELETE_ENV_VAR           "INGEST_DELETE"

#define SSH_PORT_ENV_VAR                "INGEST_SSH_PORT"
#define SSH_DIR_ENV_VAR                 "INGEST_SSH_DIR"
#define SSH_KNOWNHOSTS_PATH_ENV_VAR     "INGEST_SSH_KNOWNHOSTS_PATH"
#define SSH_PASSPHRASE_ENV_VAR          "INGEST_SSH_PASSPHRASE"
#define SSH_PRIKEY_PATH_ENV_VAR         "INGEST_SSH_PRIKEY_PATH"
#define SSH_PUBKEY_PATH_ENV_VAR         "INGEST_SSH_PUBKEY_PATH"

#endif /* _INGEST_DEFS_H */
