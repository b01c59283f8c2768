/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef TAINT_SPEC_READER_HPP
#define TAINT_SPEC_READER_HPP

#include <iostream>
#include <string>
#include <vector>

namespace Taintspec {
namespace taint_model {

/*! Reader of taint spec lists written in YAML.  The document is either
 *  a sequence of spec strings:
 *
 *    - dedicated=gpu:NoSchedule
 *    - maintenance-
 *
 *  or a mapping with such a sequence under "taints".
 */
class taint_spec_reader_t {
   public:
    /*! Read spec strings from is and append them to specs.
     *
     * \param is     input stream holding a YAML document
     * \param specs  spec strings read, in document order
     * \return       0 on success; -1 on error with errno set to EINVAL
     */
    int read (std::istream &is, std::vector<std::string> &specs);

    /*! Read spec strings from the YAML file at path.
     *
     * \return       0 on success; -1 on error with errno set to
     *               ENOENT (cannot open) or EINVAL
     */
    int read_file (const std::string &path, std::vector<std::string> &specs);

    const std::string &err_message () const;
    void clear_err_message ();

   private:
    std::string m_err_msg = "";
};

}  // namespace taint_model
}  // namespace Taintspec

#endif  // TAINT_SPEC_READER_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
