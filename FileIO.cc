#include "FileIO.h"

bool File::IsWeb (const string &path)
{
	return path.find("://") != string::npos;
}

shared_ptr<File> File::Open (const string &path, const char *mode) 
{
	if (IsWeb(path)) 
		return make_shared<WebFile>(path, mode);
	else
		return make_shared<File>(path, mode);
}

bool File::Exists (const string &path)
{
	bool result = false;
	if (IsWeb(path)) {
		CURL *ch = curl_easy_init();
		if (!ch) return false;
		curl_easy_setopt(ch, CURLOPT_URL, path.c_str());
		curl_easy_setopt(ch, CURLOPT_NOBODY, 1L);
		curl_easy_setopt(ch, CURLOPT_FAILONERROR, 1L);
		result = (curl_easy_perform(ch) == CURLE_OK);
		curl_easy_cleanup(ch);
	}
	else {
		FILE *f = fopen(path.c_str(), "r");
		result = (f != 0);
		if (f) fclose(f);
	}
	return result;
}

File::File ():
	fh(0), fsize(0)
{
}

File::File (FILE *handle):
	fh(handle), fsize(0)
{
}

File::File (const string &path, const char *mode):
	fh(0), fsize(0)
{ 
	open(path, mode); 
}

File::~File () 
{
	close();
}

void File::open (const string &path, const char *mode) 
{ 
	fh = fopen(path.c_str(), mode); 
	if (!fh) throw CXException("Cannot open file %s", path.c_str());
	if (mode[0] == 'r')
		get_size();
}

void File::close () 
{ 
	if (fh && fh != stdout && fh != stdin) fclose(fh);
	else if (fh) fflush(fh);
	fh = 0; 
}

ssize_t File::read (void *buffer, size_t size) 
{ 
	return fread(buffer, 1, size, fh); 
}

ssize_t File::read (void *buffer, size_t size, size_t offset) 
{
	if (fseek(fh, offset, SEEK_SET))
		throw CXException("Cannot seek to %zu", offset);
	return read(buffer, size);
}

uint32_t File::readU32 () 
{
	uint8_t b[4];
	if (read(b, 4) != 4)
		throw CXException("uint32_t read failed");
	return readLE(b, 4);
}

size_t File::readAll (Array<uint8_t> &a)
{
	size_t sz = size();
	a.resize(sz);
	size_t got = 0;
	seek(0);
	while (got < sz) {
		ssize_t r = read(a.data() + got, sz - got);
		if (r <= 0)
			throw CXException("Read failed after %zu of %zu bytes", got, sz);
		got += r;
	}
	return got;
}

ssize_t File::write (const void *buffer, size_t size) 
{ 
	size_t w = fwrite(buffer, 1, size, fh); 
	if (w != size)
		throw CXException("Write failed after %zu of %zu bytes", w, size);
	return w;
}

ssize_t File::seek (size_t pos)
{
	return fseek(fh, pos, SEEK_SET);
}

size_t File::size () 
{
	return fsize;
}

void File::get_size () 
{
	fseek(fh, 0, SEEK_END);
	long sz = ftell(fh);
	if (sz < 0)
		throw CXException("Cannot determine file size");
	fsize = sz;
	fseek(fh, 0, SEEK_SET);
}

WebFile::WebFile (const string &path, const char *mode):
	ch(0), fsize(0), foffset(0)
{ 
	open(path, mode); 
}

WebFile::~WebFile () 
{
	close();
}

void WebFile::open (const string &path, const char *mode) 
{ 
	if (mode[0] != 'r')
		throw CXException("Cannot write to %s", path.c_str());
	ch = curl_easy_init();
	if (!ch) throw CXException("Cannot open file %s", path.c_str());
	curl_easy_setopt(ch, CURLOPT_URL, path.c_str());
	curl_easy_setopt(ch, CURLOPT_VERBOSE, 0L);
	curl_easy_setopt(ch, CURLOPT_FOLLOWLOCATION, 1L);
	curl_easy_setopt(ch, CURLOPT_WRITEFUNCTION, WebFile::CURLCallback); 
	curl_easy_setopt(ch, CURLOPT_FAILONERROR, 1L);
	get_size();
	foffset = 0;
}

void WebFile::close () 
{ 
	if (ch) curl_easy_cleanup(ch);
	ch = 0; 
}

ssize_t WebFile::read (void *buffer, size_t size) 
{ 
	return read(buffer, size, foffset);
}

ssize_t WebFile::read (void *buffer, size_t size, size_t offset) 
{
	if (offset >= fsize || !size)
		return 0;
	size = min(size, fsize - offset);

	CURLBuffer bfr;
	curl_easy_setopt(ch, CURLOPT_WRITEDATA, (void*)&bfr); 
	curl_easy_setopt(ch, CURLOPT_RANGE, S("%zu-%zu", offset, offset + size - 1).c_str());
	auto result = curl_easy_perform(ch);
	if (result != CURLE_OK)
		throw CXException("CURL read failed: %s", curl_easy_strerror(result));
	// servers without range support send the whole body
	size_t got = min(bfr.size, size);
	memcpy(buffer, bfr.data, got);
	foffset = offset + got;
	return got;
}

ssize_t WebFile::write (const void *buffer, size_t size) 
{ 
	throw CXException("CURL write is not supported"); 
}

ssize_t WebFile::seek (size_t pos)
{
	foffset = pos;
	return 0;
}

size_t WebFile::size () 
{
	return fsize;
}

void WebFile::get_size () 
{
	curl_easy_setopt(ch, CURLOPT_NOBODY, 1L);
	curl_easy_setopt(ch, CURLOPT_HEADER, 0L);
	auto res = curl_easy_perform(ch);
	if (res != CURLE_OK)
		throw CXException("Cannot open %s", curl_easy_strerror(res));
 
 	double sz;
	res = curl_easy_getinfo(ch, CURLINFO_CONTENT_LENGTH_DOWNLOAD, &sz);
	if (res != CURLE_OK || sz < 0) 
		throw CXException("Web server does not support file size query");
	fsize = (size_t)sz;
	curl_easy_setopt(ch, CURLOPT_NOBODY, 0L);
	curl_easy_setopt(ch, CURLOPT_HTTPGET, 1L);
}

size_t WebFile::CURLCallback (void *ptr, size_t size, size_t nmemb, void *data) 
{
	size_t realsize = size * nmemb;
	CURLBuffer *buffer = (CURLBuffer*)data;
	char *p = (char*)realloc(buffer->data, buffer->size + realsize);
	// returning less than realsize aborts the transfer
	if (!p) 
		return 0;
	buffer->data = p;
	memcpy(buffer->data + buffer->size, ptr, realsize);
	buffer->size += realsize;		
	return realsize;
}
