#include <service_loaders/builtin_catalog.hpp>
#include <initializer_list>

namespace service_loaders {

service_model::ServiceCatalog generate_builtin_catalog() {
    service_model::ServiceCatalog out;
    out.name = "Cloud services concept map (built-in)";

    auto add_service =
        [&](const char* key,
            const char* name,
            const char* category,
            const char* description,
            std::initializer_list<const char*> key_points)
    {
        service_model::Service s;
        s.key = key;
        s.name = name;
        s.category = category;
        s.description = description;
        for (auto p : key_points)
            s.key_points.emplace_back(p);
        out.services.push_back(std::move(s));
    };
    auto connect = [&](const char* a, const char* b) {
        out.connections.push_back(service_model::Connection{ a, b });
    };

    add_service("vpc", "VPC", "networking", "Isolated virtual network for your resources.",
        { "Subnets span a single availability zone", "Security groups are stateful" });
    add_service("route53", "Route 53", "networking", "Managed DNS and health checking.",
        { "Alias records for load balancers", "Latency and weighted routing" });
    add_service("elb", "Elastic Load Balancing", "networking", "Distributes traffic across targets.",
        { "Application, network and gateway balancers" });
    add_service("apigateway", "API Gateway", "networking", "Managed HTTP and WebSocket APIs.",
        { "Throttling and usage plans", "Integrates with Lambda" });
    add_service("directconnect", "Direct Connect", "networking", "Dedicated link to the cloud region.",
        { "Consistent network performance" });
    add_service("transitgateway", "Transit Gateway", "networking", "Hub connecting VPCs and on-premises networks.",
        { "Replaces VPC peering meshes" });

    add_service("ec2", "EC2", "compute", "Resizable virtual machines.",
        { "On-demand, reserved and spot pricing", "Instance families per workload" });
    add_service("lambda", "Lambda", "compute", "Event-driven serverless functions.",
        { "Pay per invocation", "15 minute maximum runtime" });
    add_service("ecs", "ECS", "compute", "Container orchestration.",
        { "Fargate or EC2 launch types" });
    add_service("eks", "EKS", "compute", "Managed Kubernetes control plane.",
        { "Upstream Kubernetes compatible" });
    add_service("autoscaling", "Auto Scaling", "compute", "Adjusts capacity to demand.",
        { "Target tracking policies" });
    add_service("batch", "Batch", "compute", "Managed batch job scheduling.",
        { "Job queues and compute environments" });

    add_service("s3", "S3", "storage", "Object storage with high durability.",
        { "Storage classes and lifecycle rules", "Versioning and replication" });
    add_service("ebs", "EBS", "storage", "Block volumes for EC2.",
        { "Snapshots stored in S3" });
    add_service("efs", "EFS", "storage", "Elastic NFS file system.",
        { "Shared across instances" });
    add_service("glacier", "S3 Glacier", "storage", "Archive storage tiers.",
        { "Retrieval from minutes to hours" });

    add_service("rds", "RDS", "database", "Managed relational databases.",
        { "Multi-AZ deployments", "Read replicas" });
    add_service("dynamodb", "DynamoDB", "database", "Serverless key-value and document database.",
        { "Single-digit millisecond latency", "Global tables" });
    add_service("aurora", "Aurora", "database", "Cloud-native MySQL and PostgreSQL compatible engine.",
        { "Storage auto-scales to 128 TiB" });
    add_service("elasticache", "ElastiCache", "database", "Managed Redis and Memcached.",
        { "Sub-millisecond reads" });

    add_service("iam", "IAM", "security", "Identities and access policies.",
        { "Least privilege", "Roles for workloads" });
    add_service("kms", "KMS", "security", "Managed encryption keys.",
        { "Envelope encryption" });
    add_service("cognito", "Cognito", "security", "User sign-up and sign-in.",
        { "User pools and identity pools" });
    add_service("waf", "WAF", "security", "Web application firewall.",
        { "Managed rule groups" });
    add_service("secretsmanager", "Secrets Manager", "security", "Stores and rotates secrets.",
        { "Automatic rotation with Lambda" });

    add_service("cloudwatch", "CloudWatch", "management", "Metrics, logs and alarms.",
        { "Dashboards", "Log insights queries" });
    add_service("cloudformation", "CloudFormation", "management", "Infrastructure as code.",
        { "Stacks and change sets" });
    add_service("cloudtrail", "CloudTrail", "management", "API activity auditing.",
        { "Organization trails" });

    add_service("sqs", "SQS", "messaging", "Managed message queues.",
        { "Standard and FIFO queues" });
    add_service("sns", "SNS", "messaging", "Pub/sub notifications.",
        { "Fan-out to queues and functions" });
    add_service("eventbridge", "EventBridge", "messaging", "Serverless event bus.",
        { "Schema registry", "Scheduled rules" });
    add_service("stepfunctions", "Step Functions", "messaging", "Workflow orchestration.",
        { "Standard and express workflows" });

    add_service("codepipeline", "CodePipeline", "devtools", "Continuous delivery pipelines.",
        { "Source, build and deploy stages" });
    add_service("codebuild", "CodeBuild", "devtools", "Managed build service.",
        { "Per-minute billing" });

    add_service("cloudfront", "CloudFront", "cdn", "Global content delivery network.",
        { "Edge caching", "Origin shield" });

    add_service("costexplorer", "Cost Explorer", "cost", "Visualises spending over time.",
        { "Forecasts and reservations coverage" });
    add_service("budgets", "Budgets", "cost", "Alerts on spend thresholds.",
        { "Budget actions" });

    connect("vpc", "ec2");
    connect("vpc", "rds");
    connect("vpc", "elb");
    connect("vpc", "transitgateway");
    connect("vpc", "directconnect");
    connect("route53", "elb");
    connect("route53", "cloudfront");
    connect("elb", "ec2");
    connect("elb", "ecs");
    connect("apigateway", "lambda");
    connect("apigateway", "cognito");
    connect("ec2", "ebs");
    connect("ec2", "autoscaling");
    connect("ec2", "iam");
    connect("lambda", "dynamodb");
    connect("lambda", "s3");
    connect("lambda", "sqs");
    connect("lambda", "eventbridge");
    connect("ecs", "ec2");
    connect("eks", "ec2");
    connect("batch", "ec2");
    connect("s3", "glacier");
    connect("s3", "cloudfront");
    connect("s3", "kms");
    connect("efs", "ec2");
    connect("rds", "aurora");
    connect("rds", "secretsmanager");
    connect("elasticache", "rds");
    connect("dynamodb", "kms");
    connect("waf", "cloudfront");
    connect("waf", "apigateway");
    connect("cloudwatch", "ec2");
    connect("cloudwatch", "lambda");
    connect("cloudtrail", "s3");
    connect("cloudformation", "iam");
    connect("sns", "sqs");
    connect("eventbridge", "stepfunctions");
    connect("stepfunctions", "lambda");
    connect("codepipeline", "codebuild");
    connect("codepipeline", "cloudformation");
    connect("costexplorer", "budgets");

    return out;
}

} // namespace service_loaders
