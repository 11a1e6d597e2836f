
#ifndef MIRRORBACKEND_H
#define MIRRORBACKEND_H

#include <string>
#include <vector>

using namespace std;


class MirrorBackend {
public:
    virtual ~MirrorBackend() {}

    /* Copy the contents of source into destination preserving attributes.  excludes are
     * rsync-style patterns relative to source.  With deleteExtraneous, anything at the
     * destination that isn't in source is removed, except paths matching excludes. */
    virtual bool mirror(string source, string destination, const vector<string>& excludes, bool deleteExtraneous) = 0;

    virtual string lastError() = 0;
};

#endif

