
#ifndef EXCEPTION_H
#define EXCEPTION_H

#include <string>

using namespace std;


/*
 Every failure the engine reports is an SBException (or one of the kinds
 below).  detail() is the human readable message; getData() carries the
 subject of the failure (a path, a reference, a site label) when there is one.
 */
class SBException : public std::exception {
    string message;
    string data;

public:
    SBException(string msg) : message(msg) {}
    SBException(string msg, string d) : message(msg), data(d) {}

    string detail() const { return message; }
    string getData() const { return data; }
    const char* what() const noexcept { return message.c_str(); }
};


#define SB_EXCEPTION_KIND(kind) \
    class kind : public SBException { \
    public: \
        kind(string msg) : SBException(msg) {} \
        kind(string msg, string d) : SBException(msg, d) {} \
    };

SB_EXCEPTION_KIND(ConfigurationError)       // bad site profile, unknown site, bad CLI value
SB_EXCEPTION_KIND(RepositoryError)          // repository can't be created, verified or isn't there
SB_EXCEPTION_KIND(StagingError)             // mirroring into the repository or staging failed
SB_EXCEPTION_KIND(CommitError)              // commit never succeeded
SB_EXCEPTION_KIND(DumpError)                // database export failed or its tool is missing
SB_EXCEPTION_KIND(RestoreFileError)         // checkout or copy-out of a snapshot failed
SB_EXCEPTION_KIND(RestoreDatabaseError)     // database import failed
SB_EXCEPTION_KIND(ReferenceNotFoundError)   // requested snapshot doesn't exist

#endif

