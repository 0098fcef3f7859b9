#include "PatternCatalog.hpp"

// Built-in catalog. Same document format as a user config file.
static const char* kDefaultPatternsJSON = R"JSON(
{
  "engine": { "prefilter": true },
  "patterns": {
    "AWS": {
      "description": "Amazon Web Services credentials",
      "rules": [
        {
          "name": "aws_access_key_id",
          "regex": "\\b(?:AKIA|ASIA|AGPA|AIDA|AROA|ANPA|ANVA|AIPA)[0-9A-Z]{16}\\b",
          "placeholder": "<REDACT_AWS_KEY>",
          "description": "AWS access key id"
        },
        {
          "name": "aws_secret_access_key",
          "regex": "aws_?secret_?(?:access_?)?key\\s*[:=]\\s*[\"']?[A-Za-z0-9/+=]{40}[\"']?",
          "placeholder": "<REDACT_AWS_SECRET>",
          "description": "AWS secret access key assignment"
        }
      ]
    },
    "GITHUB": {
      "description": "GitHub tokens",
      "rules": [
        {
          "name": "github_token",
          "regex": "\\bgh[pousr]_[A-Za-z0-9]{36,255}\\b",
          "placeholder": "<REDACT_GITHUB_TOKEN>",
          "description": "GitHub personal/OAuth/app token"
        },
        {
          "name": "github_fine_grained_pat",
          "regex": "\\bgithub_pat_[A-Za-z0-9_]{22,255}\\b",
          "placeholder": "<REDACT_GITHUB_TOKEN>",
          "description": "GitHub fine-grained personal access token"
        }
      ]
    },
    "SLACK": {
      "description": "Slack credentials",
      "rules": [
        {
          "name": "slack_token",
          "regex": "\\bxox[baprs]-[A-Za-z0-9-]{10,72}",
          "placeholder": "<REDACT_SLACK_TOKEN>",
          "description": "Slack bot/user/app token"
        },
        {
          "name": "slack_webhook",
          "regex": "https://hooks\\.slack\\.com/services/[A-Za-z0-9_/]+",
          "placeholder": "<REDACT_SLACK_WEBHOOK>",
          "description": "Slack incoming webhook URL"
        }
      ]
    },
    "CLOUD_API_KEYS": {
      "description": "Third-party API keys",
      "rules": [
        {
          "name": "google_api_key",
          "regex": "\\bAIza[0-9A-Za-z_-]{35}",
          "placeholder": "<REDACT_GOOGLE_API_KEY>",
          "description": "Google API key"
        },
        {
          "name": "stripe_secret_key",
          "regex": "\\b(?:sk|rk)_(?:live|test)_[0-9A-Za-z]{16,99}\\b",
          "placeholder": "<REDACT_STRIPE_KEY>",
          "description": "Stripe secret or restricted key"
        },
        {
          "name": "openai_api_key",
          "regex": "\\bsk-(?:proj-)?[A-Za-z0-9_-]{20,}",
          "placeholder": "<REDACT_OPENAI_KEY>",
          "description": "OpenAI API key"
        }
      ]
    },
    "TOKENS": {
      "description": "Bearer tokens, JWTs and key material",
      "rules": [
        {
          "name": "jwt",
          "regex": "\\beyJ[A-Za-z0-9_-]{5,}\\.eyJ[A-Za-z0-9_-]{5,}\\.[A-Za-z0-9_-]{5,}",
          "placeholder": "<REDACT_JWT>",
          "description": "JSON Web Token"
        },
        {
          "name": "bearer_token",
          "regex": "\\bbearer\\s+[A-Za-z0-9._~+/-]+=*",
          "placeholder": "<REDACT_BEARER_TOKEN>",
          "description": "HTTP Authorization bearer token"
        },
        {
          "name": "private_key_block",
          "regex": "-----BEGIN [A-Z ]*PRIVATE KEY-----[\\s\\S]*?-----END [A-Z ]*PRIVATE KEY-----",
          "placeholder": "<REDACT_PRIVATE_KEY>",
          "description": "PEM private key block"
        }
      ]
    },
    "CREDENTIALS": {
      "description": "Credentials in assignments and URLs",
      "rules": [
        {
          "name": "password_assignment",
          "regex": "\\b(?:password|passwd|pwd)\\s*[:=]\\s*[\"']?[^\\s\"']+[\"']?",
          "placeholder": "<REDACT_PASSWORD>",
          "description": "password=... / password: ..."
        },
        {
          "name": "api_key_assignment",
          "regex": "\\b(?:api_?key|api-key|secret_?key|access_?token|auth_?token)\\s*[:=]\\s*[\"']?[A-Za-z0-9_./+=-]{8,}[\"']?",
          "placeholder": "<REDACT_API_KEY>",
          "description": "api_key=... style assignment"
        },
        {
          "name": "database_url",
          "regex": "\\b(?:postgres(?:ql)?|mysql|mongodb(?:\\+srv)?|redis|amqp)://[^\\s:/@]+:[^\\s@/]+@\\S+",
          "placeholder": "<REDACT_DB_URL>",
          "description": "Connection string with embedded credentials"
        }
      ]
    },
    "PII": {
      "description": "Personal information",
      "rules": [
        {
          "name": "email",
          "regex": "\\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\\.[A-Za-z]{2,}\\b",
          "placeholder": "<REDACT_EMAIL>",
          "description": "Email address"
        },
        {
          "name": "ipv4",
          "regex": "\\b(?:(?:25[0-5]|2[0-4][0-9]|1[0-9]{2}|[1-9]?[0-9])\\.){3}(?:25[0-5]|2[0-4][0-9]|1[0-9]{2}|[1-9]?[0-9])\\b",
          "placeholder": "<REDACT_IPV4>",
          "description": "IPv4 address"
        },
        {
          "name": "credit_card",
          "regex": "\\b(?:4[0-9]{12}(?:[0-9]{3})?|5[1-5][0-9]{14}|3[47][0-9]{13}|6(?:011|5[0-9]{2})[0-9]{12})\\b",
          "placeholder": "<REDACT_CREDIT_CARD>",
          "description": "Visa/Mastercard/Amex/Discover card number"
        }
      ]
    }
  }
}
)JSON";

const char* PatternCatalog::defaultPatternsJson() { return kDefaultPatternsJSON; }
