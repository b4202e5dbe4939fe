/*******************************************************************************
 * Copyright 2018 IBM Corp. All Rights Reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *  https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 *******************************************************************************/

#include <string>
#include <fstream>
#include <iostream>
#include <vector>

/** @file msgcompiler.cc
    Transforms the messages.cfg catalogue into the msgdefs.h header
    (message enumeration, message texts and message names) and into
    a doxygen alias file that documents all messages.
 */

typedef struct
{
    std::string msgname;
    std::string msgtxt;
} message_t;

const std::string IDENTIFIER = "PKGMIG";

std::string escape(std::string input)

{
    std::string result;

    for (char c : input) {
        switch (c) {
            case '<':
                result += "\\<";
                break;
            case '>':
                result += "\\>";
                break;
            default:
                result += c;
        }
    }

    return result;
}

int main(int argc, char **argv)

{
    std::string first;
    std::string second;
    std::string line;
    std::vector<message_t> messages;
    std::vector<message_t> documentation;
    std::vector<message_t>::iterator it;
    std::ifstream infile;
    std::ofstream outfile;
    std::ofstream doxfile;
    int lineNum = 0;

    if (argc != 4) {
        std::cerr << "usage: " << argv[0]
                << " <message text file name> <compiled message header> <compiled documentation file>"
                << std::endl;
        return -1;
    }

    infile.open(argv[1]);
    if (!infile.is_open()) {
        std::cerr << "unable to open input file " << argv[1] << "."
                << std::endl;
        return -1;
    }

    outfile.open(argv[2]);
    if (!outfile.is_open()) {
        std::cerr << "unable to open output file " << argv[2] << "."
                << std::endl;
        return -1;
    }

    doxfile.open(argv[3]);
    if (!doxfile.is_open()) {
        std::cerr << "unable to open output file " << argv[3] << "."
                << std::endl;
        return -1;
    }

    while (std::getline(infile, line)) {
        lineNum++;
        // remove leading white spaces and tabs
        line = line.erase(0, line.find_first_not_of(" \t"));
        // if line is empty or a comment continue with next line
        if (line.size() == 0 || line[0] == '#') {
            continue;
        }
        // if line starts with '"' append the message
        else if (line[0] == '"') {
            if (messages.size() == 0) {
                std::cerr << "line " << lineNum
                        << ": continuation without a message." << std::endl;
                return -1;
            }
            messages.back().msgtxt += '\n';
            messages.back().msgtxt += "                       ";
            messages.back().msgtxt += "+std::string(" + line + ")";
            documentation.back().msgtxt += "<BR>";
            documentation.back().msgtxt += escape(line);
        }
        // new message
        else {
            if (line.compare(0, IDENTIFIER.size(), IDENTIFIER)
                    || line.find('"') == std::string::npos) {
                std::cerr << "Line " << lineNum << ":" << std::endl;
                std::cerr << ">>" << line << "<< " << std::endl;
                std::cerr << "does not look correctly formatted." << std::endl;
                std::cerr << "Message compilation stopped." << std::endl;
                return -1;
            }
            first = line.substr(0, line.find(' '));
            second = line.substr(line.find('"'), std::string::npos);
            messages.push_back(
                    message_t { first, "std::string(" + second + ")" });
            documentation.push_back(message_t { first, escape(second) });
        }
    }

    infile.close();

    // create the header file
    outfile << "#pragma once" << std::endl;
    outfile << std::endl;
    outfile << "#include <string>" << std::endl;
    outfile << std::endl;
    outfile << "typedef std::string pkgmig_message_t[];" << std::endl;
    outfile << "typedef std::string pkgmig_msgname_t[];" << std::endl;
    outfile << std::endl;
    outfile << "enum pkgmig_msg_id {" << std::endl;
    for (it = messages.begin(); it != messages.end(); ++it) {
        if (it + 1 != messages.end())
            outfile << "    " << it->msgname << "," << std::endl;
        else
            outfile << "    " << it->msgname << std::endl;
    }
    outfile << "};" << std::endl;
    outfile << std::endl;

    outfile << "const pkgmig_message_t pkgmig_messages = {" << std::endl;
    for (it = messages.begin(); it != messages.end(); ++it) {
        if (it + 1 != messages.end())
            outfile << "    " << "/* " << it->msgname << " */  " << it->msgtxt
                    << "," << std::endl;
        else
            outfile << "    " << "/* " << it->msgname << " */  " << it->msgtxt
                    << std::endl;
    }
    outfile << "};" << std::endl;
    outfile << std::endl;

    outfile << "const pkgmig_msgname_t pkgmig_msgname = {" << std::endl;
    for (it = messages.begin(); it != messages.end(); ++it) {
        if (it + 1 != messages.end())
            outfile << "    " << "\"" << it->msgname << "\"," << std::endl;
        else
            outfile << "    " << "\"" << it->msgname << "\"" << std::endl;
    }
    outfile << "};" << std::endl;
    outfile << std::endl;

    outfile.close();

    for (it = documentation.begin(); it != documentation.end(); ++it) {
        doxfile << "ALIASES += " << it->msgname << "=" << it->msgtxt
                << std::endl;
    }

    doxfile.close();

    return 0;
}
