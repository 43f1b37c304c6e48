#ifndef FileIO_H
#define FileIO_H

#include "Common.h"
#include <curl/curl.h>

using namespace std;

class File
{
	FILE *fh;
	size_t fsize;

protected:
	File ();

public:
	File (FILE *handle);
	File (const string &path, const char *mode);
	virtual ~File ();

	virtual void open (const string &path, const char *mode);
	virtual void close ();

	virtual ssize_t read (void *buffer, size_t size);
	virtual ssize_t read (void *buffer, size_t size, size_t offset);
	virtual ssize_t write (const void *buffer, size_t size);

	virtual uint32_t readU32 ();
	// reads the whole file from the start into a
	virtual size_t readAll (Array<uint8_t> &a);

	virtual ssize_t seek (size_t pos);
	virtual size_t size ();

private:
	virtual void get_size ();

public:
	static shared_ptr<File> Open (const string &path, const char *mode);
	static bool Exists (const string &path);
	static bool IsWeb (const string &path);
};

// Read-only file served over http(s); reads are HTTP range requests
class WebFile: public File 
{
	CURL *ch;
	size_t fsize, foffset;

public:
	WebFile (const string &path, const char *mode);
	~WebFile ();

	void open (const string &path, const char *mode);
	void close ();

	ssize_t read (void *buffer, size_t size);
	ssize_t read (void *buffer, size_t size, size_t offset);
	ssize_t write (const void *buffer, size_t size);

	ssize_t seek (size_t pos);
	size_t size ();

private:
	void get_size ();

	struct CURLBuffer {
		char *data;
		size_t size;
		CURLBuffer () : data(0), size(0) {};
		~CURLBuffer () { free(data); }
	};
	static size_t CURLCallback (void *ptr, size_t size, size_t nmemb, void *data);
};

#endif // FileIO_H
