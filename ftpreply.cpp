#include "ftpreply.h"

#include <stdio.h>
#include <string.h>
#include <ctype.h>

std::string ftpreply::Text() const
{
	if (lines.empty())
	{
		return std::string();
	}
	return lines.front();
}

int ftpreply::Code() const
{
	if (lines.empty())
	{
		return 0;
	}
	const std::string &l = lines.front();
	if ((l.size() < 3) || !isdigit(static_cast<unsigned char>(l[0]))
	        || !isdigit(static_cast<unsigned char>(l[1]))
	        || !isdigit(static_cast<unsigned char>(l[2])))
	{
		return 0;
	}
	return (l[0] - '0') * 100 + (l[1] - '0') * 10 + (l[2] - '0');
}

bool ftpreply::TransferComplete() const
{
	return !lines.empty() && (lines.front().compare(0, 3, "226") == 0);
}

hostport::hostport()
{
	memset(v, 0, sizeof(v));
}

/*
 * Parse - extract h1,h2,h3,h4,p1,p2 from a PASV/CPSV reply
 *
 * The tuple is taken from between the parentheses when the server sends
 * them, otherwise from the first digit after the reply code on.
 *
 * return 1 if successful, 0 otherwise
 */
int hostport::Parse(const char *reply)
{
	const char *cp, *end, *start;
	unsigned int n[6];
	int count = 0;

	if (reply == NULL)
	{
		return 0;
	}

	cp = strchr(reply, '(');
	if (cp != NULL)
	{
		cp++;
		end = strchr(cp, ')');
		if (end == NULL)
		{
			return 0;
		}
	}
	else
	{
		cp = (strlen(reply) > 4) ? reply + 4 : reply + strlen(reply);
		while (*cp && !isdigit(static_cast<unsigned char>(*cp)))
		{
			cp++;
		}
		end = cp;
		while (*end && (isdigit(static_cast<unsigned char>(*end)) || (*end == ',')))
		{
			end++;
		}
	}

	start = cp;
	while (cp < end)
	{
		unsigned int val = 0;
		int digits = 0;

		if (count == 6)
		{
			return 0;   // too many components
		}
		while ((cp < end) && isdigit(static_cast<unsigned char>(*cp)))
		{
			val = val * 10 + static_cast<unsigned int>(*cp - '0');
			cp++;
			if (++digits > 3)
			{
				return 0;
			}
		}
		if ((digits == 0) || (val > 255))
		{
			return 0;
		}
		n[count++] = val;

		if (cp == end)
		{
			break;
		}
		if (*cp != ',')
		{
			return 0;   // non-numeric component
		}
		cp++;
		if (cp == end)
		{
			return 0;   // trailing comma
		}
	}

	if (count != 6)
	{
		return 0;
	}
	for (int i = 0; i < 6; i++)
	{
		v[i] = static_cast<unsigned char>(n[i]);
	}
	raw.assign(start, end);
	return 1;
}

std::string hostport::Encode() const
{
	char buf[32];

	if (!raw.empty())
	{
		return raw;
	}
	sprintf(buf, "%d,%d,%d,%d,%d,%d", v[0], v[1], v[2], v[3], v[4], v[5]);
	return buf;
}

std::string hostport::Host() const
{
	char buf[16];
	sprintf(buf, "%d.%d.%d.%d", v[0], v[1], v[2], v[3]);
	return buf;
}

unsigned short hostport::Port() const
{
	return static_cast<unsigned short>((v[4] << 8) | v[5]);
}

void hostport::SetHost(const unsigned char addr[4])
{
	memcpy(v, addr, 4);
	raw.clear();
}
